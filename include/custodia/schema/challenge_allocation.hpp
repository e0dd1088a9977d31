#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: challenge allocation.
// Escrow workflow: Dispute opening; only arbitration leaves the challenged
// status.
namespace custodia::schema {

template <uint16_t Version>
struct challenge_allocation;

template <>
struct challenge_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using challenge_allocation_t = challenge_allocation<1>;

}  // namespace custodia::schema
