#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct conclude_investigation;

template <>
struct conclude_investigation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using conclude_investigation_t = conclude_investigation<1>;

}  // namespace custodia::schema
