#pragma once

#include <custodia/schema/allocation.hpp>
#include <custodia/schema/allocation_status.hpp>
#include <custodia/schema/primitives.hpp>
#include <custodia/schema/role_id.hpp>
#include <cstdint>
#include <initializer_list>

// Pure predicates shared by every engine operation. None of them touch the
// store or the ledger.
namespace custodia::execution::guards {

using role_mask_t = uint8_t;
using status_mask_t = uint16_t;

inline constexpr role_mask_t role_bit(const custodia::schema::role_id_t role) {
  return static_cast<role_mask_t>(1u << static_cast<uint8_t>(role));
}

inline constexpr role_mask_t roles(
    std::initializer_list<custodia::schema::role_id_t> values) {
  auto mask = role_mask_t{};
  for (auto value : values) {
    mask |= role_bit(value);
  }
  return mask;
}

inline constexpr status_mask_t status_bit(
    const custodia::schema::allocation_status_t status) {
  return static_cast<status_mask_t>(1u << static_cast<uint8_t>(status));
}

inline constexpr status_mask_t statuses(
    std::initializer_list<custodia::schema::allocation_status_t> values) {
  auto mask = status_mask_t{};
  for (auto value : values) {
    mask |= status_bit(value);
  }
  return mask;
}

/// Every status for which is_terminal() is false.
inline constexpr status_mask_t non_terminal_statuses() {
  auto mask = status_mask_t{};
  for (auto i = std::size_t{}; i < custodia::schema::kAllocationStatusCount;
       ++i) {
    auto status = static_cast<custodia::schema::allocation_status_t>(i);
    if (!custodia::schema::is_terminal(status)) {
      mask |= status_bit(status);
    }
  }
  return mask;
}

/// Identifiers start at 1 and never exceed the last one issued.
inline constexpr bool identifier_valid(
    const custodia::schema::allocation_id_t id,
    const custodia::schema::allocation_id_t last) {
  return id != 0 && id <= last;
}

template <typename Storage>
bool identifier_exists(const Storage& storage,
                       const custodia::schema::allocation_id_t id) {
  return storage.contains(id);
}

/// Roles `caller` holds on `allocation`. Supervisor authority comes from
/// configuration, not from the record.
role_mask_t roles_of(const custodia::schema::allocation_t& allocation,
                     const custodia::schema::account_id_t& caller,
                     const custodia::schema::account_id_t& supervisor);

inline constexpr bool is_actor_in(const role_mask_t held,
                                  const role_mask_t allowed) {
  return (held & allowed) != 0;
}

inline constexpr bool status_in(
    const custodia::schema::allocation_status_t status,
    const status_mask_t allowed) {
  return (status_bit(status) & allowed) != 0;
}

inline constexpr bool within_deadline(
    const custodia::schema::block_height_t now,
    const custodia::schema::block_height_t termination_block) {
  return now <= termination_block;
}

inline constexpr bool is_expired(
    const custodia::schema::block_height_t now,
    const custodia::schema::block_height_t termination_block) {
  return now > termination_block;
}

/// Beneficiary must be a real account distinct from the originator and the
/// custodian.
bool valid_beneficiary(const custodia::schema::account_id_t& beneficiary,
                       const custodia::schema::account_id_t& originator,
                       const custodia::schema::account_id_t& custodian);

inline constexpr bool is_recent(
    const custodia::schema::block_height_t timestamp,
    const custodia::schema::block_height_t now,
    const custodia::schema::block_height_t window) {
  return timestamp <= now && now - timestamp <= window;
}

}  // namespace custodia::execution::guards
