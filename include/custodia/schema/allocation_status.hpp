#pragma once

#include <custodia/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: allocation status.
// Escrow lifecycle: pending and accepted are active, six statuses are terminal,
// the rest suspend an allocation until a supervisor-side exit.
namespace custodia::schema {

enum class allocation_status_t : uint8_t {
  pending = 0,
  accepted = 1,
  completed = 2,
  reverted = 3,
  terminated = 4,
  expired = 5,
  frozen = 6,
  challenged = 7,
  arbitrated = 8,
  locked = 9,
  held = 10,
  paused = 11,
  timelocked = 12,
  retrieved = 13
};

inline constexpr auto kAllocationStatusCount = std::size_t{14};

inline constexpr auto kAllocationStatusMappings = std::array{
    enum_name_t<allocation_status_t>{"pending", allocation_status_t::pending},
    enum_name_t<allocation_status_t>{"accepted", allocation_status_t::accepted},
    enum_name_t<allocation_status_t>{"completed",
                                     allocation_status_t::completed},
    enum_name_t<allocation_status_t>{"reverted", allocation_status_t::reverted},
    enum_name_t<allocation_status_t>{"terminated",
                                     allocation_status_t::terminated},
    enum_name_t<allocation_status_t>{"expired", allocation_status_t::expired},
    enum_name_t<allocation_status_t>{"frozen", allocation_status_t::frozen},
    enum_name_t<allocation_status_t>{"challenged",
                                     allocation_status_t::challenged},
    enum_name_t<allocation_status_t>{"arbitrated",
                                     allocation_status_t::arbitrated},
    enum_name_t<allocation_status_t>{"locked", allocation_status_t::locked},
    enum_name_t<allocation_status_t>{"held", allocation_status_t::held},
    enum_name_t<allocation_status_t>{"paused", allocation_status_t::paused},
    enum_name_t<allocation_status_t>{"timelocked",
                                     allocation_status_t::timelocked},
    enum_name_t<allocation_status_t>{"retrieved",
                                     allocation_status_t::retrieved}};

static_assert(kAllocationStatusMappings.size() == kAllocationStatusCount);

template <>
inline std::optional<allocation_status_t> try_from_string<allocation_status_t>(
    const std::string_view value) {
  return from_string(value, kAllocationStatusMappings);
}

inline constexpr std::string_view to_string(const allocation_status_t value) {
  return name_of(value, kAllocationStatusMappings);
}

/// Terminal statuses are permanent; no operation lists them as a pre-state.
inline constexpr bool is_terminal(const allocation_status_t value) {
  switch (value) {
    case allocation_status_t::completed:
    case allocation_status_t::reverted:
    case allocation_status_t::terminated:
    case allocation_status_t::expired:
    case allocation_status_t::arbitrated:
    case allocation_status_t::retrieved:
      return true;
    default:
      return false;
  }
}

}  // namespace custodia::schema
