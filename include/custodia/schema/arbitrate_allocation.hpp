#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: arbitrate allocation.
// Escrow workflow: Dispute resolution: splits the quantity between originator
// and beneficiary by the originator's percentage.
namespace custodia::schema {

template <uint16_t Version>
struct arbitrate_allocation;

template <>
struct arbitrate_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  uint8_t originator_percentage{};
};

using arbitrate_allocation_t = arbitrate_allocation<1>;

}  // namespace custodia::schema
