#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: retrieve allocation.
// Escrow workflow: Beneficiary collection of a timelocked allocation after its
// deadline.
namespace custodia::schema {

template <uint16_t Version>
struct retrieve_allocation;

template <>
struct retrieve_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using retrieve_allocation_t = retrieve_allocation<1>;

}  // namespace custodia::schema
