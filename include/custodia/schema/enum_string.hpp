#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace custodia::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

inline constexpr auto kUnknownEnumName = std::string_view{"unknown"};

/// Reverse lookup in a name table; std::nullopt for unknown names.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_name_t<Enum>, N>& mappings) {
  for (const auto& entry : mappings) {
    if (entry.first == value) {
      return entry.second;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& mappings) {
  for (const auto& entry : mappings) {
    if (entry.second == value) {
      return entry.first;
    }
  }
  return kUnknownEnumName;
}

/// Specialized beside each enum that has a name table.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace custodia::schema
