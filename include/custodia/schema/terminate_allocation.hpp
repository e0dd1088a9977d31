#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: terminate allocation.
// Escrow workflow: Originator cancellation of a pending allocation before its
// deadline.
namespace custodia::schema {

template <uint16_t Version>
struct terminate_allocation;

template <>
struct terminate_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using terminate_allocation_t = terminate_allocation<1>;

}  // namespace custodia::schema
