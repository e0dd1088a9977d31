#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: add security hold.
// Escrow workflow: Supervisor hold that also pushes the termination block out.
namespace custodia::schema {

template <uint16_t Version>
struct add_security_hold;

template <>
struct add_security_hold<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  block_height_t hold_duration{};
};

using add_security_hold_t = add_security_hold<1>;

}  // namespace custodia::schema
