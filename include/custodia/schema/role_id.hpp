#pragma once

#include <custodia/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Escrow workflow: the three parties an operation can be authorized for. One
// account may hold several roles on the same allocation.
namespace custodia::schema {

enum class role_id_t : uint8_t {
  supervisor = 0,
  originator = 1,
  beneficiary = 2
};

inline constexpr auto kRoleIdMappings = std::array{
    enum_name_t<role_id_t>{"supervisor", role_id_t::supervisor},
    enum_name_t<role_id_t>{"originator", role_id_t::originator},
    enum_name_t<role_id_t>{"beneficiary", role_id_t::beneficiary},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return name_of(value, kRoleIdMappings);
}

}  // namespace custodia::schema
