#include <custodia/common/critical.hpp>
#include <custodia/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace custodia::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_hash32(bytes);
  if (!hash.has_value()) {
    custodia::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  auto decoded = try_from_hex(bytes);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

bool is_zero_hash(const hash32_t& hash) {
  return std::all_of(std::begin(hash), std::end(hash),
                     [](const uint8_t byte) { return byte == 0; });
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty()) {
    return std::nullopt;
  }
  static const auto kMax = std::numeric_limits<amount_t>::max();
  auto value = amount_t{0};
  for (const auto ch : decimal) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    auto digit = static_cast<unsigned>(ch - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = (value * 10) + digit;
  }
  return value;
}

}  // namespace custodia::schema
