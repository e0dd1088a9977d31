#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: top up allocation.
// Escrow workflow: Additional escrow from the originator into an active
// allocation.
namespace custodia::schema {

template <uint16_t Version>
struct top_up_allocation;

template <>
struct top_up_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  amount_t amount{};
};

using top_up_allocation_t = top_up_allocation<1>;

}  // namespace custodia::schema
