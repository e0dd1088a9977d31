#pragma once
#include <custodia/schema/accept_allocation.hpp>
#include <custodia/schema/add_security_hold.hpp>
#include <custodia/schema/approve_multisig.hpp>
#include <custodia/schema/arbitrate_allocation.hpp>
#include <custodia/schema/challenge_allocation.hpp>
#include <custodia/schema/conclude_investigation.hpp>
#include <custodia/schema/configure_rate_limit.hpp>
#include <custodia/schema/create_allocation.hpp>
#include <custodia/schema/emergency_freeze.hpp>
#include <custodia/schema/establish_timelock.hpp>
#include <custodia/schema/extend_deadline.hpp>
#include <custodia/schema/finalize_allocation.hpp>
#include <custodia/schema/lock_for_investigation.hpp>
#include <custodia/schema/pause_allocation.hpp>
#include <custodia/schema/reclaim_lapsed.hpp>
#include <custodia/schema/register_multisig.hpp>
#include <custodia/schema/register_oversight.hpp>
#include <custodia/schema/release_installment.hpp>
#include <custodia/schema/release_partial.hpp>
#include <custodia/schema/release_security_hold.hpp>
#include <custodia/schema/resume_allocation.hpp>
#include <custodia/schema/retrieve_allocation.hpp>
#include <custodia/schema/revert_allocation.hpp>
#include <custodia/schema/set_priority.hpp>
#include <custodia/schema/submit_attestation.hpp>
#include <custodia/schema/submit_documentation.hpp>
#include <custodia/schema/terminate_allocation.hpp>
#include <custodia/schema/top_up_allocation.hpp>
#include <custodia/schema/transfer_control.hpp>
#include <custodia/schema/unfreeze_allocation.hpp>
#include <custodia/schema/verify_two_factor.hpp>
#include <variant>

namespace custodia::schema {

using operation_payload_t = std::variant<accept_allocation_t,
                                         add_security_hold_t,
                                         approve_multisig_t,
                                         arbitrate_allocation_t,
                                         challenge_allocation_t,
                                         conclude_investigation_t,
                                         configure_rate_limit_t,
                                         create_allocation_t,
                                         emergency_freeze_t,
                                         establish_timelock_t,
                                         extend_deadline_t,
                                         finalize_allocation_t,
                                         lock_for_investigation_t,
                                         pause_allocation_t,
                                         reclaim_lapsed_t,
                                         register_multisig_t,
                                         register_oversight_t,
                                         release_installment_t,
                                         release_partial_t,
                                         release_security_hold_t,
                                         resume_allocation_t,
                                         retrieve_allocation_t,
                                         revert_allocation_t,
                                         set_priority_t,
                                         submit_attestation_t,
                                         submit_documentation_t,
                                         terminate_allocation_t,
                                         top_up_allocation_t,
                                         transfer_control_t,
                                         unfreeze_allocation_t,
                                         verify_two_factor_t>;

}  // namespace custodia::schema
