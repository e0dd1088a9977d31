#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace custodia::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using allocation_id_t = uint64_t;
using resource_id_t = uint64_t;
using block_height_t = uint64_t;

bytes_t make_bytes(const std::string_view& bytes);

hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();
bool is_zero_hash(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Parse a decimal amount; std::nullopt on empty input, non-digits, or
/// values that do not fit in 256 bits.
std::optional<amount_t> try_make_amount(std::string_view decimal);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace custodia::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
