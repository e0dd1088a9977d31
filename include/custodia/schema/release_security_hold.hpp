#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct release_security_hold;

template <>
struct release_security_hold<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using release_security_hold_t = release_security_hold<1>;

}  // namespace custodia::schema
