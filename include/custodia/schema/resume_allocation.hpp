#pragma once
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct resume_allocation;

template <>
struct resume_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using resume_allocation_t = resume_allocation<1>;

}  // namespace custodia::schema
