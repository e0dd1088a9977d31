#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct extend_deadline;

template <>
struct extend_deadline<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  block_height_t additional_blocks{};
};

using extend_deadline_t = extend_deadline<1>;

}  // namespace custodia::schema
