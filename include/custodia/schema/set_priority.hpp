#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct set_priority;

template <>
struct set_priority<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  uint8_t level{};
};

using set_priority_t = set_priority<1>;

}  // namespace custodia::schema
