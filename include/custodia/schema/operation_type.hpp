#pragma once

#include <custodia/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation type.
// Escrow workflow: every entry point of the registry, used to key the
// transition table and to name audit events.
namespace custodia::schema {

enum class operation_type_t : uint8_t {
  create_allocation = 0,
  accept = 1,
  finalize = 2,
  revert = 3,
  terminate = 4,
  reclaim_lapsed = 5,
  emergency_freeze = 6,
  lock_for_investigation = 7,
  challenge = 8,
  arbitrate = 9,
  pause = 10,
  add_security_hold = 11,
  establish_timelock = 12,
  unfreeze = 13,
  conclude_investigation = 14,
  resume = 15,
  release_security_hold = 16,
  retrieve = 17,
  release_partial = 18,
  release_installment = 19,
  top_up = 20,
  extend_deadline = 21,
  transfer_control = 22,
  verify_two_factor = 23,
  register_multisig = 24,
  approve_multisig = 25,
  submit_documentation = 26,
  submit_attestation = 27,
  configure_rate_limit = 28,
  register_oversight = 29,
  set_priority = 30
};

inline constexpr auto kOperationTypeMappings = std::array{
    enum_name_t<operation_type_t>{"create_allocation",
                                  operation_type_t::create_allocation},
    enum_name_t<operation_type_t>{"accept", operation_type_t::accept},
    enum_name_t<operation_type_t>{"finalize", operation_type_t::finalize},
    enum_name_t<operation_type_t>{"revert", operation_type_t::revert},
    enum_name_t<operation_type_t>{"terminate", operation_type_t::terminate},
    enum_name_t<operation_type_t>{"reclaim_lapsed",
                                  operation_type_t::reclaim_lapsed},
    enum_name_t<operation_type_t>{"emergency_freeze",
                                  operation_type_t::emergency_freeze},
    enum_name_t<operation_type_t>{"lock_for_investigation",
                                  operation_type_t::lock_for_investigation},
    enum_name_t<operation_type_t>{"challenge", operation_type_t::challenge},
    enum_name_t<operation_type_t>{"arbitrate", operation_type_t::arbitrate},
    enum_name_t<operation_type_t>{"pause", operation_type_t::pause},
    enum_name_t<operation_type_t>{"add_security_hold",
                                  operation_type_t::add_security_hold},
    enum_name_t<operation_type_t>{"establish_timelock",
                                  operation_type_t::establish_timelock},
    enum_name_t<operation_type_t>{"unfreeze", operation_type_t::unfreeze},
    enum_name_t<operation_type_t>{"conclude_investigation",
                                  operation_type_t::conclude_investigation},
    enum_name_t<operation_type_t>{"resume", operation_type_t::resume},
    enum_name_t<operation_type_t>{"release_security_hold",
                                  operation_type_t::release_security_hold},
    enum_name_t<operation_type_t>{"retrieve", operation_type_t::retrieve},
    enum_name_t<operation_type_t>{"release_partial",
                                  operation_type_t::release_partial},
    enum_name_t<operation_type_t>{"release_installment",
                                  operation_type_t::release_installment},
    enum_name_t<operation_type_t>{"top_up", operation_type_t::top_up},
    enum_name_t<operation_type_t>{"extend_deadline",
                                  operation_type_t::extend_deadline},
    enum_name_t<operation_type_t>{"transfer_control",
                                  operation_type_t::transfer_control},
    enum_name_t<operation_type_t>{"verify_two_factor",
                                  operation_type_t::verify_two_factor},
    enum_name_t<operation_type_t>{"register_multisig",
                                  operation_type_t::register_multisig},
    enum_name_t<operation_type_t>{"approve_multisig",
                                  operation_type_t::approve_multisig},
    enum_name_t<operation_type_t>{"submit_documentation",
                                  operation_type_t::submit_documentation},
    enum_name_t<operation_type_t>{"submit_attestation",
                                  operation_type_t::submit_attestation},
    enum_name_t<operation_type_t>{"configure_rate_limit",
                                  operation_type_t::configure_rate_limit},
    enum_name_t<operation_type_t>{"register_oversight",
                                  operation_type_t::register_oversight},
    enum_name_t<operation_type_t>{"set_priority",
                                  operation_type_t::set_priority}};

template <>
inline std::optional<operation_type_t> try_from_string<operation_type_t>(
    const std::string_view value) {
  return from_string(value, kOperationTypeMappings);
}

inline constexpr std::string_view to_string(const operation_type_t value) {
  return name_of(value, kOperationTypeMappings);
}

}  // namespace custodia::schema
