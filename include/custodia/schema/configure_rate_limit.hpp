#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct configure_rate_limit;

template <>
struct configure_rate_limit<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  uint32_t max_operations{};
  block_height_t window_blocks{};
};

using configure_rate_limit_t = configure_rate_limit<1>;

}  // namespace custodia::schema
