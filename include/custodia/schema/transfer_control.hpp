#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: transfer control.
// Escrow workflow: Hands the originator role to another account.
namespace custodia::schema {

template <uint16_t Version>
struct transfer_control;

template <>
struct transfer_control<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  account_id_t new_originator{};
};

using transfer_control_t = transfer_control<1>;

}  // namespace custodia::schema
