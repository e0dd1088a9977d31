#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: revert allocation.
// Escrow workflow: Supervisor override that returns a pending allocation to its
// originator.
namespace custodia::schema {

template <uint16_t Version>
struct revert_allocation;

template <>
struct revert_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using revert_allocation_t = revert_allocation<1>;

}  // namespace custodia::schema
