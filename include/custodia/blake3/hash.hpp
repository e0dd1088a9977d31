#pragma once
#include <custodia/schema/primitives.hpp>
#include <string_view>

namespace custodia::blake3 {

custodia::schema::hash32_t hash(const std::string_view& str);
custodia::schema::hash32_t hash(const custodia::schema::bytes_view_t& bytes);

}  // namespace custodia::blake3
