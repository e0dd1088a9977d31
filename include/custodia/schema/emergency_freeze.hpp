#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct emergency_freeze;

template <>
struct emergency_freeze<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using emergency_freeze_t = emergency_freeze<1>;

}  // namespace custodia::schema
