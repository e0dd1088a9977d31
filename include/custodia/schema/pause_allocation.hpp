#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct pause_allocation;

template <>
struct pause_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using pause_allocation_t = pause_allocation<1>;

}  // namespace custodia::schema
