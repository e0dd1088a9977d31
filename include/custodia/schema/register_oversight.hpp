#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: register oversight.
// Escrow workflow: Names a monitoring account. Audit only.
namespace custodia::schema {

template <uint16_t Version>
struct register_oversight;

template <>
struct register_oversight<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  account_id_t monitor{};
};

using register_oversight_t = register_oversight<1>;

}  // namespace custodia::schema
