#pragma once

#include <custodia/execution/guards.hpp>
#include <custodia/schema/allocation_status.hpp>
#include <custodia/schema/error_code.hpp>
#include <custodia/schema/operation_type.hpp>
#include <custodia/schema/role_id.hpp>
#include <array>
#include <cstdint>
#include <optional>

namespace custodia::execution {

enum class deadline_policy_t : uint8_t {
  none = 0,
  /// now <= termination block, else `lapsed`.
  within = 1,
  /// now > termination block, else `not_lapsed`.
  lapsed = 2
};

/// Who receives the full remaining quantity when the transition commits.
enum class payout_t : uint8_t { none = 0, beneficiary = 1, originator = 2 };

/// Authorization, status and deadline gates of one operation.
///
/// `post_state` is empty for operations that leave the status alone or
/// decide it from operation data (partial releases complete at zero).
/// `status_error` is reported when the current status is not in
/// `pre_states`.
struct transition_rule final {
  custodia::schema::operation_type_t operation;
  guards::role_mask_t actors;
  guards::status_mask_t pre_states;
  std::optional<custodia::schema::allocation_status_t> post_state;
  deadline_policy_t deadline;
  custodia::schema::error_code_t status_error;
  payout_t payout;
};

namespace detail {

using custodia::schema::allocation_status_t;
using custodia::schema::error_code_t;
using custodia::schema::operation_type_t;
using custodia::schema::role_id_t;

inline constexpr auto kSupervisor = guards::roles({role_id_t::supervisor});
inline constexpr auto kOriginator = guards::roles({role_id_t::originator});
inline constexpr auto kBeneficiary = guards::roles({role_id_t::beneficiary});
inline constexpr auto kSupervisorOrOriginator =
    guards::roles({role_id_t::supervisor, role_id_t::originator});
inline constexpr auto kParties = guards::roles(
    {role_id_t::originator, role_id_t::beneficiary});
inline constexpr auto kAnyRole = guards::roles(
    {role_id_t::supervisor, role_id_t::originator, role_id_t::beneficiary});

inline constexpr auto kPending =
    guards::statuses({allocation_status_t::pending});
inline constexpr auto kActive = guards::statuses(
    {allocation_status_t::pending, allocation_status_t::accepted});
inline constexpr auto kNonTerminal = guards::non_terminal_statuses();

}  // namespace detail

/// One rule per operation_type_t, indexed by its numeric value.
inline constexpr auto kTransitionRules = std::array{
    // Creation has no pre-state; the engine checks it separately.
    transition_rule{detail::operation_type_t::create_allocation, 0, 0,
                    detail::allocation_status_t::pending,
                    deadline_policy_t::none, detail::error_code_t::ok,
                    payout_t::none},
    transition_rule{detail::operation_type_t::accept, detail::kBeneficiary,
                    detail::kPending, detail::allocation_status_t::accepted,
                    deadline_policy_t::within,
                    detail::error_code_t::not_pending, payout_t::none},
    transition_rule{detail::operation_type_t::finalize,
                    detail::kSupervisorOrOriginator, detail::kActive,
                    detail::allocation_status_t::completed,
                    deadline_policy_t::within, detail::error_code_t::not_active,
                    payout_t::beneficiary},
    transition_rule{detail::operation_type_t::revert, detail::kSupervisor,
                    detail::kPending, detail::allocation_status_t::reverted,
                    deadline_policy_t::none, detail::error_code_t::not_pending,
                    payout_t::originator},
    transition_rule{detail::operation_type_t::terminate, detail::kOriginator,
                    detail::kPending, detail::allocation_status_t::terminated,
                    deadline_policy_t::within,
                    detail::error_code_t::not_pending, payout_t::originator},
    transition_rule{detail::operation_type_t::reclaim_lapsed,
                    detail::kSupervisorOrOriginator, detail::kActive,
                    detail::allocation_status_t::expired,
                    deadline_policy_t::lapsed, detail::error_code_t::not_active,
                    payout_t::originator},
    transition_rule{
        detail::operation_type_t::emergency_freeze, detail::kAnyRole,
        static_cast<guards::status_mask_t>(
            detail::kNonTerminal &
            ~guards::status_bit(detail::allocation_status_t::frozen)),
        detail::allocation_status_t::frozen, deadline_policy_t::none,
        detail::error_code_t::not_freezable, payout_t::none},
    transition_rule{detail::operation_type_t::lock_for_investigation,
                    detail::kSupervisorOrOriginator, detail::kNonTerminal,
                    detail::allocation_status_t::locked,
                    deadline_policy_t::none,
                    detail::error_code_t::allocation_finalized, payout_t::none},
    transition_rule{detail::operation_type_t::challenge, detail::kParties,
                    detail::kActive, detail::allocation_status_t::challenged,
                    deadline_policy_t::within, detail::error_code_t::not_active,
                    payout_t::none},
    // Both shares are paid by the arbitration handler itself.
    transition_rule{
        detail::operation_type_t::arbitrate, detail::kSupervisor,
        guards::statuses({detail::allocation_status_t::challenged}),
        detail::allocation_status_t::arbitrated, deadline_policy_t::none,
        detail::error_code_t::not_challenged, payout_t::none},
    transition_rule{detail::operation_type_t::pause, detail::kAnyRole,
                    detail::kActive, detail::allocation_status_t::paused,
                    deadline_policy_t::none, detail::error_code_t::not_active,
                    payout_t::none},
    transition_rule{detail::operation_type_t::add_security_hold,
                    detail::kSupervisor, detail::kPending,
                    detail::allocation_status_t::held, deadline_policy_t::none,
                    detail::error_code_t::not_pending, payout_t::none},
    transition_rule{detail::operation_type_t::establish_timelock,
                    detail::kOriginator, detail::kPending,
                    detail::allocation_status_t::timelocked,
                    deadline_policy_t::none, detail::error_code_t::not_pending,
                    payout_t::none},
    transition_rule{detail::operation_type_t::unfreeze, detail::kSupervisor,
                    guards::statuses({detail::allocation_status_t::frozen}),
                    detail::allocation_status_t::pending,
                    deadline_policy_t::none, detail::error_code_t::not_frozen,
                    payout_t::none},
    transition_rule{detail::operation_type_t::conclude_investigation,
                    detail::kSupervisor,
                    guards::statuses({detail::allocation_status_t::locked}),
                    detail::allocation_status_t::pending,
                    deadline_policy_t::none, detail::error_code_t::not_locked,
                    payout_t::none},
    transition_rule{detail::operation_type_t::resume,
                    detail::kSupervisorOrOriginator,
                    guards::statuses({detail::allocation_status_t::paused}),
                    detail::allocation_status_t::pending,
                    deadline_policy_t::none, detail::error_code_t::not_paused,
                    payout_t::none},
    transition_rule{detail::operation_type_t::release_security_hold,
                    detail::kSupervisor,
                    guards::statuses({detail::allocation_status_t::held}),
                    detail::allocation_status_t::pending,
                    deadline_policy_t::none, detail::error_code_t::not_held,
                    payout_t::none},
    transition_rule{detail::operation_type_t::retrieve, detail::kBeneficiary,
                    guards::statuses({detail::allocation_status_t::timelocked}),
                    detail::allocation_status_t::retrieved,
                    deadline_policy_t::lapsed,
                    detail::error_code_t::not_timelocked,
                    payout_t::beneficiary},
    transition_rule{detail::operation_type_t::release_partial,
                    detail::kSupervisorOrOriginator, detail::kActive,
                    std::nullopt, deadline_policy_t::within,
                    detail::error_code_t::not_active, payout_t::none},
    transition_rule{detail::operation_type_t::release_installment,
                    detail::kSupervisorOrOriginator, detail::kActive,
                    std::nullopt, deadline_policy_t::within,
                    detail::error_code_t::not_active, payout_t::none},
    transition_rule{detail::operation_type_t::top_up, detail::kOriginator,
                    detail::kActive, std::nullopt, deadline_policy_t::within,
                    detail::error_code_t::not_active, payout_t::none},
    transition_rule{detail::operation_type_t::extend_deadline,
                    detail::kOriginator, detail::kActive, std::nullopt,
                    deadline_policy_t::within, detail::error_code_t::not_active,
                    payout_t::none},
    transition_rule{detail::operation_type_t::transfer_control,
                    detail::kOriginator, detail::kActive, std::nullopt,
                    deadline_policy_t::none, detail::error_code_t::not_active,
                    payout_t::none},
    transition_rule{detail::operation_type_t::verify_two_factor,
                    detail::kParties, detail::kActive, std::nullopt,
                    deadline_policy_t::none, detail::error_code_t::not_active,
                    payout_t::none},
    transition_rule{detail::operation_type_t::register_multisig,
                    detail::kOriginator, detail::kPending, std::nullopt,
                    deadline_policy_t::none, detail::error_code_t::not_pending,
                    payout_t::none},
    transition_rule{detail::operation_type_t::approve_multisig,
                    detail::kAnyRole, detail::kActive, std::nullopt,
                    deadline_policy_t::none, detail::error_code_t::not_active,
                    payout_t::none},
    transition_rule{
        detail::operation_type_t::submit_documentation, detail::kParties,
        guards::statuses({detail::allocation_status_t::pending,
                          detail::allocation_status_t::accepted,
                          detail::allocation_status_t::challenged}),
        std::nullopt, deadline_policy_t::none,
        detail::error_code_t::not_documentable, payout_t::none},
    transition_rule{detail::operation_type_t::submit_attestation,
                    detail::kAnyRole, detail::kNonTerminal, std::nullopt,
                    deadline_policy_t::none,
                    detail::error_code_t::allocation_finalized, payout_t::none},
    transition_rule{detail::operation_type_t::configure_rate_limit,
                    detail::kSupervisor, detail::kActive, std::nullopt,
                    deadline_policy_t::none, detail::error_code_t::not_active,
                    payout_t::none},
    transition_rule{detail::operation_type_t::register_oversight,
                    detail::kSupervisorOrOriginator, detail::kNonTerminal,
                    std::nullopt, deadline_policy_t::none,
                    detail::error_code_t::allocation_finalized, payout_t::none},
    transition_rule{detail::operation_type_t::set_priority,
                    detail::kSupervisorOrOriginator, detail::kActive,
                    std::nullopt, deadline_policy_t::none,
                    detail::error_code_t::not_active, payout_t::none}};

inline constexpr bool transition_rules_indexed() {
  for (auto i = std::size_t{}; i < kTransitionRules.size(); ++i) {
    if (static_cast<std::size_t>(kTransitionRules[i].operation) != i) {
      return false;
    }
  }
  return true;
}

static_assert(kTransitionRules.size() ==
              custodia::schema::kOperationTypeMappings.size());
static_assert(transition_rules_indexed());

inline constexpr const transition_rule& rule_for(
    const custodia::schema::operation_type_t operation) {
  return kTransitionRules[static_cast<std::size_t>(operation)];
}

}  // namespace custodia::execution
