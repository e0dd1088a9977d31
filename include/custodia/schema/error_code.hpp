#pragma once

#include <cstdint>
#include <string_view>

// Schema type: error code.
// Escrow workflow: every rejected operation reports exactly one code; codes are
// stable numbers so callers can branch on them, and each code belongs to one
// coarse kind.
namespace custodia::schema {

enum class error_kind_t : uint8_t {
  none = 0,
  unauthorized = 1,
  not_found = 2,
  already_processed = 3,
  movement_failed = 4,
  invalid_identifier = 5,
  invalid_quantity = 6,
  invalid_party = 7,
  lapsed = 8,
  verification_failed = 9,
};

enum class error_code_t : uint32_t {
  ok = 0,
  invalid_identifier = 1,
  allocation_missing = 2,
  unauthorized = 3,
  not_pending = 10,
  not_active = 11,
  not_challenged = 12,
  not_frozen = 13,
  not_locked = 14,
  not_paused = 15,
  not_held = 16,
  not_timelocked = 17,
  not_freezable = 18,
  allocation_finalized = 19,
  not_documentable = 20,
  lapsed = 30,
  not_lapsed = 31,
  stale_timestamp = 32,
  future_timestamp = 33,
  invalid_quantity = 40,
  insufficient_quantity = 41,
  invalid_percentage = 42,
  invalid_duration = 43,
  deadline_overflow = 44,
  invalid_unlock_height = 45,
  invalid_threshold = 46,
  invalid_rate_limit = 47,
  invalid_priority = 48,
  quantity_overflow = 49,
  dust_release = 50,
  invalid_beneficiary = 60,
  custodian_as_party = 61,
  invalid_originator = 62,
  duplicate_signer = 63,
  invalid_monitor = 64,
  signature_invalid = 70,
  signer_mismatch = 71,
  invalid_reference_hash = 72,
  movement_failed = 80,
};

inline constexpr error_kind_t kind_of(const error_code_t code) {
  switch (code) {
    case error_code_t::ok:
      return error_kind_t::none;
    case error_code_t::invalid_identifier:
      return error_kind_t::invalid_identifier;
    case error_code_t::allocation_missing:
      return error_kind_t::not_found;
    case error_code_t::unauthorized:
      return error_kind_t::unauthorized;
    case error_code_t::not_pending:
    case error_code_t::not_active:
    case error_code_t::not_challenged:
    case error_code_t::not_frozen:
    case error_code_t::not_locked:
    case error_code_t::not_paused:
    case error_code_t::not_held:
    case error_code_t::not_timelocked:
    case error_code_t::not_freezable:
    case error_code_t::allocation_finalized:
    case error_code_t::not_documentable:
      return error_kind_t::already_processed;
    case error_code_t::lapsed:
    case error_code_t::not_lapsed:
    case error_code_t::stale_timestamp:
    case error_code_t::future_timestamp:
      return error_kind_t::lapsed;
    case error_code_t::invalid_quantity:
    case error_code_t::insufficient_quantity:
    case error_code_t::invalid_percentage:
    case error_code_t::invalid_duration:
    case error_code_t::deadline_overflow:
    case error_code_t::invalid_unlock_height:
    case error_code_t::invalid_threshold:
    case error_code_t::invalid_rate_limit:
    case error_code_t::invalid_priority:
    case error_code_t::quantity_overflow:
    case error_code_t::dust_release:
      return error_kind_t::invalid_quantity;
    case error_code_t::invalid_beneficiary:
    case error_code_t::custodian_as_party:
    case error_code_t::invalid_originator:
    case error_code_t::duplicate_signer:
    case error_code_t::invalid_monitor:
      return error_kind_t::invalid_party;
    case error_code_t::signature_invalid:
    case error_code_t::signer_mismatch:
    case error_code_t::invalid_reference_hash:
      return error_kind_t::verification_failed;
    case error_code_t::movement_failed:
      return error_kind_t::movement_failed;
  }
  return error_kind_t::none;
}

inline constexpr std::string_view to_string(const error_code_t code) {
  switch (code) {
    case error_code_t::ok:
      return "ok";
    case error_code_t::invalid_identifier:
      return "invalid allocation identifier";
    case error_code_t::allocation_missing:
      return "allocation not found";
    case error_code_t::unauthorized:
      return "caller is not authorized for this operation";
    case error_code_t::not_pending:
      return "allocation is not pending";
    case error_code_t::not_active:
      return "allocation is not pending or accepted";
    case error_code_t::not_challenged:
      return "allocation is not challenged";
    case error_code_t::not_frozen:
      return "allocation is not frozen";
    case error_code_t::not_locked:
      return "allocation is not locked";
    case error_code_t::not_paused:
      return "allocation is not paused";
    case error_code_t::not_held:
      return "allocation is not held";
    case error_code_t::not_timelocked:
      return "allocation is not timelocked";
    case error_code_t::not_freezable:
      return "allocation is already frozen or finalized";
    case error_code_t::allocation_finalized:
      return "allocation is finalized";
    case error_code_t::not_documentable:
      return "allocation does not accept documentation";
    case error_code_t::lapsed:
      return "allocation deadline has passed";
    case error_code_t::not_lapsed:
      return "allocation deadline has not passed";
    case error_code_t::stale_timestamp:
      return "timestamp is outside the recent window";
    case error_code_t::future_timestamp:
      return "timestamp is in the future";
    case error_code_t::invalid_quantity:
      return "quantity must be positive";
    case error_code_t::insufficient_quantity:
      return "quantity exceeds remaining escrow";
    case error_code_t::invalid_percentage:
      return "percentage out of range";
    case error_code_t::invalid_duration:
      return "duration out of range";
    case error_code_t::deadline_overflow:
      return "deadline overflows block height";
    case error_code_t::invalid_unlock_height:
      return "unlock height is beyond the termination block";
    case error_code_t::invalid_threshold:
      return "multisig threshold out of range";
    case error_code_t::invalid_rate_limit:
      return "rate limit out of range";
    case error_code_t::invalid_priority:
      return "priority out of range";
    case error_code_t::quantity_overflow:
      return "quantity overflows";
    case error_code_t::dust_release:
      return "release rounds down to zero";
    case error_code_t::invalid_beneficiary:
      return "beneficiary must differ from originator";
    case error_code_t::custodian_as_party:
      return "custodian account cannot be a party";
    case error_code_t::invalid_originator:
      return "invalid new originator";
    case error_code_t::duplicate_signer:
      return "duplicate or invalid multisig signer";
    case error_code_t::invalid_monitor:
      return "invalid oversight monitor";
    case error_code_t::signature_invalid:
      return "signature verification failed";
    case error_code_t::signer_mismatch:
      return "recovered signer does not match caller";
    case error_code_t::invalid_reference_hash:
      return "reference hash must be non-zero";
    case error_code_t::movement_failed:
      return "ledger transfer failed";
  }
  return "unknown";
}

}  // namespace custodia::schema
