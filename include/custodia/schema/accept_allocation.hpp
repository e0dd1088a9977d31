#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: accept allocation.
// Escrow workflow: Beneficiary acknowledgement of a pending allocation.
namespace custodia::schema {

template <uint16_t Version>
struct accept_allocation;

template <>
struct accept_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using accept_allocation_t = accept_allocation<1>;

}  // namespace custodia::schema
