#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct unfreeze_allocation;

template <>
struct unfreeze_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using unfreeze_allocation_t = unfreeze_allocation<1>;

}  // namespace custodia::schema
