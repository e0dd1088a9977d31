#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: create allocation.
// Escrow workflow: Funding: escrows quantity from the caller into custody and
// opens a pending allocation for the beneficiary.
namespace custodia::schema {

template <uint16_t Version>
struct create_allocation;

template <>
struct create_allocation<1> final {
  uint16_t version{1};
  account_id_t beneficiary{};
  resource_id_t resource_id{};
  amount_t quantity{};
  block_height_t duration{};
};

using create_allocation_t = create_allocation<1>;

}  // namespace custodia::schema
