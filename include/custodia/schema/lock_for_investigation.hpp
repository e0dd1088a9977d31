#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct lock_for_investigation;

template <>
struct lock_for_investigation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using lock_for_investigation_t = lock_for_investigation<1>;

}  // namespace custodia::schema
