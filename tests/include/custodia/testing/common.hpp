#pragma once

#include <custodia/blake3/hash.hpp>
#include <custodia/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace custodia::testing {

inline custodia::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = custodia::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline custodia::schema::account_id_t make_account(
    const std::string_view label) {
  return custodia::blake3::hash(label);
}

}  // namespace custodia::testing
