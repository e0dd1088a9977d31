#include <spdlog/spdlog.h>
#include <custodia/common/critical.hpp>
#include <custodia/crypto/verify.hpp>
#include <custodia/execution/digest.hpp>
#include <custodia/execution/engine.hpp>
#include <custodia/execution/guards.hpp>
#include <custodia/execution/split.hpp>
#include <limits>
#include <set>
#include <string>
#include <utility>

using namespace custodia::schema;

namespace {

constexpr auto kCodespace = std::string_view{"custodia.engine"};

audit_event_attribute_t attribute(std::string key, std::string value) {
  return audit_event_attribute_t{.key = std::move(key),
                                 .value = std::move(value)};
}

audit_event_attribute_t attribute(std::string key, const amount_t& value) {
  return attribute(std::move(key), value.str());
}

audit_event_attribute_t attribute(std::string key, const uint64_t value) {
  return attribute(std::move(key), std::to_string(value));
}

audit_event_attribute_t attribute(std::string key, const hash32_t& value) {
  return attribute(std::move(key), to_hex(value));
}

}  // namespace

namespace custodia::execution {

engine::engine(encoding::scale_encoder_t& encoder,
               custodia::storage::memory_storage_t& storage,
               ledger& settlement,
               height_source_t height_source,
               engine_options_t options,
               audit_sink_t audit_sink)
    : encoder_{encoder},
      storage_{storage},
      ledger_{settlement},
      height_source_{std::move(height_source)},
      options_{std::move(options)},
      audit_sink_{std::move(audit_sink)},
      signature_verifier_{custodia::crypto::recover_signer} {
  if (!height_source_) {
    custodia::common::critical("allocation engine requires a height source");
  }
  if (!custodia::crypto::available()) {
    spdlog::warn("OpenSSL lacks Ed25519 or secp256k1; signatures will fail");
  }
  spdlog::info("Allocation engine ready: supervisor {}, custodian {}, {} "
               "allocation(s)",
               to_hex(options_.supervisor),
               to_hex(ledger_.custodian_account()),
               storage_.last_identifier());
}

operation_result_t engine::execute(const account_id_t& caller,
                                   const operation_payload_t& payload) {
  auto lock = std::unique_lock{mutex_};
  auto context = call_context{.caller = caller, .now = height_source_()};
  auto result = std::visit(
      [&](const auto& operation) { return apply(context, operation); },
      payload);
  auto event = std::exchange(pending_event_, std::nullopt);
  lock.unlock();

  if (event && audit_sink_) {
    audit_sink_(*event);
  }
  return result;
}

std::optional<allocation_t> engine::allocation(const allocation_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.load(id);
}

allocation_id_t engine::last_allocation_id() const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.last_identifier();
}

std::vector<allocation_t> engine::allocations() const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.list();
}

const engine_options_t& engine::options() const {
  return options_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!verifier) {
    signature_verifier_ = custodia::crypto::recover_signer;
    return;
  }
  signature_verifier_ = std::move(verifier);
}

operation_result_t engine::apply(const call_context& context,
                                 const create_allocation_t& payload) {
  constexpr auto operation = operation_type_t::create_allocation;
  const auto custodian = ledger_.custodian_account();
  if (context.caller == custodian) {
    return reject(operation, error_code_t::custodian_as_party, std::nullopt);
  }
  if (!guards::valid_beneficiary(payload.beneficiary, context.caller,
                                 custodian)) {
    return reject(operation, error_code_t::invalid_beneficiary, std::nullopt);
  }
  if (payload.quantity == 0) {
    return reject(operation, error_code_t::invalid_quantity, std::nullopt);
  }
  if (payload.duration == 0 || payload.duration > options_.max_duration) {
    return reject(operation, error_code_t::invalid_duration, std::nullopt);
  }
  if (payload.duration >
      std::numeric_limits<block_height_t>::max() - context.now) {
    return reject(operation, error_code_t::deadline_overflow, std::nullopt);
  }
  auto id = storage_.next_identifier();
  if (!id) {
    return reject(operation, error_code_t::invalid_identifier, std::nullopt);
  }
  auto funded = ledger_.transfer(payload.quantity, context.caller, custodian);
  if (funded != movement_result_t::completed) {
    spdlog::warn("Escrow funding of {} from {} failed",
                 payload.quantity.str(), to_hex(context.caller));
    return reject(operation, error_code_t::movement_failed, std::nullopt);
  }

  auto record = allocation_t{.allocation_id = *id,
                             .originator = context.caller,
                             .beneficiary = payload.beneficiary,
                             .resource_id = payload.resource_id,
                             .quantity = payload.quantity,
                             .status = allocation_status_t::pending,
                             .genesis_block = context.now,
                             .termination_block =
                                 context.now + payload.duration};
  if (!storage_.insert(record)) {
    custodia::common::critical("Allocation store refused identifier {}",
                               record.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("beneficiary", record.beneficiary),
        attribute("resource", record.resource_id),
        attribute("quantity", record.quantity),
        attribute("termination_block", record.termination_block)});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const accept_allocation_t& payload) {
  return transition(operation_type_t::accept, context, payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const finalize_allocation_t& payload) {
  return transition(operation_type_t::finalize, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const revert_allocation_t& payload) {
  return transition(operation_type_t::revert, context, payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const terminate_allocation_t& payload) {
  return transition(operation_type_t::terminate, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const reclaim_lapsed_t& payload) {
  return transition(operation_type_t::reclaim_lapsed, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const emergency_freeze_t& payload) {
  return transition(operation_type_t::emergency_freeze, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const lock_for_investigation_t& payload) {
  return transition(operation_type_t::lock_for_investigation, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const challenge_allocation_t& payload) {
  return transition(operation_type_t::challenge, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const arbitrate_allocation_t& payload) {
  constexpr auto operation = operation_type_t::arbitrate;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.originator_percentage > 100) {
    return reject(operation, error_code_t::invalid_percentage,
                  payload.allocation_id);
  }

  auto shares = split_quantity(record.quantity, payload.originator_percentage);
  if (pay_out(shares.originator_share, record.originator) !=
      movement_result_t::completed) {
    return reject(operation, error_code_t::movement_failed,
                  payload.allocation_id);
  }
  if (pay_out(shares.beneficiary_share, record.beneficiary) !=
      movement_result_t::completed) {
    if (shares.originator_share != 0 &&
        ledger_.transfer(shares.originator_share, record.originator,
                         ledger_.custodian_account()) !=
            movement_result_t::completed) {
      custodia::common::critical(
          "Failed to return {} to custody after arbitration of allocation {}",
          shares.originator_share.str(), record.allocation_id);
    }
    return reject(operation, error_code_t::movement_failed,
                  payload.allocation_id);
  }

  auto updated = record;
  updated.quantity = 0;
  updated.status = allocation_status_t::arbitrated;
  commit(record, updated);
  emit(operation, context, record.allocation_id,
       {attribute("originator_percentage",
                  uint64_t{payload.originator_percentage}),
        attribute("originator_share", shares.originator_share),
        attribute("beneficiary_share", shares.beneficiary_share)});
  return success(updated);
}

operation_result_t engine::apply(const call_context& context,
                                 const pause_allocation_t& payload) {
  return transition(operation_type_t::pause, context, payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const add_security_hold_t& payload) {
  constexpr auto operation = operation_type_t::add_security_hold;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.hold_duration == 0 ||
      payload.hold_duration > options_.max_hold_duration) {
    return reject(operation, error_code_t::invalid_duration,
                  payload.allocation_id);
  }
  if (payload.hold_duration > std::numeric_limits<block_height_t>::max() -
                                  record.termination_block) {
    return reject(operation, error_code_t::deadline_overflow,
                  payload.allocation_id);
  }

  auto updated = record;
  updated.termination_block += payload.hold_duration;
  updated.status = allocation_status_t::held;
  commit(record, updated);
  emit(operation, context, record.allocation_id,
       {attribute("hold_duration", payload.hold_duration),
        attribute("termination_block", updated.termination_block)});
  return success(updated);
}

operation_result_t engine::apply(const call_context& context,
                                 const establish_timelock_t& payload) {
  constexpr auto operation = operation_type_t::establish_timelock;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.unlock_height > record.termination_block) {
    return reject(operation, error_code_t::invalid_unlock_height,
                  payload.allocation_id);
  }

  auto updated = record;
  updated.status = allocation_status_t::timelocked;
  commit(record, updated);
  emit(operation, context, record.allocation_id,
       {attribute("unlock_height", payload.unlock_height)});
  return success(updated);
}

operation_result_t engine::apply(const call_context& context,
                                 const unfreeze_allocation_t& payload) {
  return transition(operation_type_t::unfreeze, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const conclude_investigation_t& payload) {
  return transition(operation_type_t::conclude_investigation, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const resume_allocation_t& payload) {
  return transition(operation_type_t::resume, context, payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const release_security_hold_t& payload) {
  return transition(operation_type_t::release_security_hold, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const retrieve_allocation_t& payload) {
  return transition(operation_type_t::retrieve, context,
                    payload.allocation_id);
}

operation_result_t engine::apply(const call_context& context,
                                 const release_partial_t& payload) {
  constexpr auto operation = operation_type_t::release_partial;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.amount == 0) {
    return reject(operation, error_code_t::invalid_quantity,
                  payload.allocation_id);
  }
  if (payload.amount > record.quantity) {
    return reject(operation, error_code_t::insufficient_quantity,
                  payload.allocation_id);
  }
  return release_to_beneficiary(operation, context, record, payload.amount);
}

operation_result_t engine::apply(const call_context& context,
                                 const release_installment_t& payload) {
  constexpr auto operation = operation_type_t::release_installment;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.percentage == 0 || payload.percentage > 100) {
    return reject(operation, error_code_t::invalid_percentage,
                  payload.allocation_id);
  }
  auto amount = percentage_of(record.quantity, payload.percentage);
  if (amount == 0) {
    return reject(operation, error_code_t::dust_release,
                  payload.allocation_id);
  }
  return release_to_beneficiary(operation, context, record, amount);
}

operation_result_t engine::apply(const call_context& context,
                                 const top_up_allocation_t& payload) {
  constexpr auto operation = operation_type_t::top_up;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.amount == 0) {
    return reject(operation, error_code_t::invalid_quantity,
                  payload.allocation_id);
  }
  if (payload.amount > std::numeric_limits<amount_t>::max() - record.quantity) {
    return reject(operation, error_code_t::quantity_overflow,
                  payload.allocation_id);
  }
  if (ledger_.transfer(payload.amount, record.originator,
                       ledger_.custodian_account()) !=
      movement_result_t::completed) {
    spdlog::warn("Top-up of {} for allocation {} failed", payload.amount.str(),
                 record.allocation_id);
    return reject(operation, error_code_t::movement_failed,
                  payload.allocation_id);
  }

  auto updated = record;
  updated.quantity += payload.amount;
  commit(record, updated);
  emit(operation, context, record.allocation_id,
       {attribute("amount", payload.amount),
        attribute("quantity", updated.quantity)});
  return success(updated);
}

operation_result_t engine::apply(const call_context& context,
                                 const extend_deadline_t& payload) {
  constexpr auto operation = operation_type_t::extend_deadline;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.additional_blocks == 0) {
    return reject(operation, error_code_t::invalid_duration,
                  payload.allocation_id);
  }
  if (payload.additional_blocks > std::numeric_limits<block_height_t>::max() -
                                      record.termination_block) {
    return reject(operation, error_code_t::deadline_overflow,
                  payload.allocation_id);
  }

  auto updated = record;
  updated.termination_block += payload.additional_blocks;
  commit(record, updated);
  emit(operation, context, record.allocation_id,
       {attribute("additional_blocks", payload.additional_blocks),
        attribute("termination_block", updated.termination_block)});
  return success(updated);
}

operation_result_t engine::apply(const call_context& context,
                                 const transfer_control_t& payload) {
  constexpr auto operation = operation_type_t::transfer_control;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (is_zero_hash(payload.new_originator) ||
      payload.new_originator == record.originator ||
      payload.new_originator == record.beneficiary) {
    return reject(operation, error_code_t::invalid_originator,
                  payload.allocation_id);
  }
  if (payload.new_originator == ledger_.custodian_account()) {
    return reject(operation, error_code_t::custodian_as_party,
                  payload.allocation_id);
  }

  auto updated = record;
  updated.originator = payload.new_originator;
  commit(record, updated);
  emit(operation, context, record.allocation_id,
       {attribute("previous_originator", record.originator),
        attribute("new_originator", updated.originator)});
  return success(updated);
}

operation_result_t engine::apply(const call_context& context,
                                 const verify_two_factor_t& payload) {
  constexpr auto operation = operation_type_t::verify_two_factor;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (auto error = check_recent(payload.timestamp, context.now);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (auto error =
          verify_signer(operation, record.allocation_id, context.caller,
                        payload.timestamp, payload.signature, context.caller);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("timestamp", payload.timestamp)});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const register_multisig_t& payload) {
  constexpr auto operation = operation_type_t::register_multisig;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.threshold == 0 || payload.threshold > payload.signers.size() ||
      payload.signers.size() > options_.max_multisig_signers) {
    return reject(operation, error_code_t::invalid_threshold,
                  payload.allocation_id);
  }
  const auto custodian = ledger_.custodian_account();
  auto seen = std::set<account_id_t>{};
  for (const auto& signer : payload.signers) {
    if (is_zero_hash(signer) || signer == custodian ||
        !seen.insert(signer).second) {
      return reject(operation, error_code_t::duplicate_signer,
                    payload.allocation_id);
    }
  }
  emit(operation, context, record.allocation_id,
       {attribute("threshold", uint64_t{payload.threshold}),
        attribute("signers", uint64_t{payload.signers.size()})});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const approve_multisig_t& payload) {
  constexpr auto operation = operation_type_t::approve_multisig;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (auto error = verify_signer(operation, record.allocation_id,
                                 context.caller, 0, payload.signature,
                                 context.caller);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("approver", context.caller)});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const submit_documentation_t& payload) {
  constexpr auto operation = operation_type_t::submit_documentation;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (is_zero_hash(payload.document_hash)) {
    return reject(operation, error_code_t::invalid_reference_hash,
                  payload.allocation_id);
  }
  if (auto error = check_recent(payload.timestamp, context.now);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("document_hash", payload.document_hash),
        attribute("timestamp", payload.timestamp)});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const submit_attestation_t& payload) {
  constexpr auto operation = operation_type_t::submit_attestation;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (is_zero_hash(payload.attestation_hash)) {
    return reject(operation, error_code_t::invalid_reference_hash,
                  payload.allocation_id);
  }
  if (auto error = verify_signer(operation, record.allocation_id,
                                 payload.attestation_hash, 0,
                                 payload.signature, context.caller);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("attestation_hash", payload.attestation_hash)});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const configure_rate_limit_t& payload) {
  constexpr auto operation = operation_type_t::configure_rate_limit;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.max_operations == 0 ||
      payload.max_operations > options_.max_rate_limit_operations ||
      payload.window_blocks == 0 ||
      payload.window_blocks > options_.max_rate_limit_window) {
    return reject(operation, error_code_t::invalid_rate_limit,
                  payload.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("max_operations", uint64_t{payload.max_operations}),
        attribute("window_blocks", payload.window_blocks)});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const register_oversight_t& payload) {
  constexpr auto operation = operation_type_t::register_oversight;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (is_zero_hash(payload.monitor) || payload.monitor == record.originator ||
      payload.monitor == record.beneficiary ||
      payload.monitor == ledger_.custodian_account()) {
    return reject(operation, error_code_t::invalid_monitor,
                  payload.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("monitor", payload.monitor)});
  return success(record);
}

operation_result_t engine::apply(const call_context& context,
                                 const set_priority_t& payload) {
  constexpr auto operation = operation_type_t::set_priority;
  auto record = allocation_t{};
  if (auto error = admit(rule_for(operation), context, payload.allocation_id,
                         record);
      error != error_code_t::ok) {
    return reject(operation, error, payload.allocation_id);
  }
  if (payload.level == 0 || payload.level > options_.max_priority) {
    return reject(operation, error_code_t::invalid_priority,
                  payload.allocation_id);
  }
  emit(operation, context, record.allocation_id,
       {attribute("level", uint64_t{payload.level})});
  return success(record);
}

error_code_t engine::admit(const transition_rule& rule,
                           const call_context& context,
                           const allocation_id_t id,
                           allocation_t& record) const {
  if (!guards::identifier_valid(id, storage_.last_identifier())) {
    return error_code_t::invalid_identifier;
  }
  if (!guards::identifier_exists(storage_, id)) {
    return error_code_t::allocation_missing;
  }
  auto stored = storage_.load(id);
  if (!stored) {
    return error_code_t::allocation_missing;
  }
  record = std::move(*stored);

  auto held = guards::roles_of(record, context.caller, options_.supervisor);
  if (!guards::is_actor_in(held, rule.actors)) {
    return error_code_t::unauthorized;
  }
  if (!guards::status_in(record.status, rule.pre_states)) {
    return rule.status_error;
  }
  switch (rule.deadline) {
    case deadline_policy_t::within:
      if (!guards::within_deadline(context.now, record.termination_block)) {
        return error_code_t::lapsed;
      }
      break;
    case deadline_policy_t::lapsed:
      if (!guards::is_expired(context.now, record.termination_block)) {
        return error_code_t::not_lapsed;
      }
      break;
    case deadline_policy_t::none:
      break;
  }
  return error_code_t::ok;
}

operation_result_t engine::transition(const operation_type_t operation,
                                      const call_context& context,
                                      const allocation_id_t id) {
  const auto& rule = rule_for(operation);
  if (!rule.post_state) {
    custodia::common::critical("transition rule without a post-state");
  }
  auto record = allocation_t{};
  if (auto error = admit(rule, context, id, record);
      error != error_code_t::ok) {
    return reject(operation, error, id);
  }

  auto attributes = std::vector<audit_event_attribute_t>{
      attribute("from", std::string{to_string(record.status)}),
      attribute("to", std::string{to_string(*rule.post_state)})};
  auto updated = record;
  if (rule.payout != payout_t::none) {
    const auto& recipient = rule.payout == payout_t::beneficiary
                                ? record.beneficiary
                                : record.originator;
    if (pay_out(record.quantity, recipient) != movement_result_t::completed) {
      return reject(operation, error_code_t::movement_failed, id);
    }
    attributes.push_back(attribute("paid", record.quantity));
    attributes.push_back(attribute("recipient", recipient));
    updated.quantity = 0;
  }
  updated.status = *rule.post_state;
  commit(record, updated);
  emit(operation, context, id, std::move(attributes));
  return success(updated);
}

operation_result_t engine::release_to_beneficiary(
    const operation_type_t operation,
    const call_context& context,
    const allocation_t& record,
    const amount_t& amount) {
  if (pay_out(amount, record.beneficiary) != movement_result_t::completed) {
    return reject(operation, error_code_t::movement_failed,
                  record.allocation_id);
  }
  auto updated = record;
  updated.quantity -= amount;
  if (updated.quantity == 0) {
    updated.status = allocation_status_t::completed;
  }
  commit(record, updated);
  emit(operation, context, record.allocation_id,
       {attribute("released", amount),
        attribute("remaining", updated.quantity)});
  return success(updated);
}

movement_result_t engine::pay_out(const amount_t& amount,
                                  const account_id_t& to) {
  if (amount == 0) {
    return movement_result_t::completed;
  }
  auto result = ledger_.transfer(amount, ledger_.custodian_account(), to);
  if (result != movement_result_t::completed) {
    spdlog::warn("Ledger refused payout of {} to {}", amount.str(),
                 to_hex(to));
  }
  return result;
}

error_code_t engine::verify_signer(const operation_type_t operation,
                                   const allocation_id_t id,
                                   const hash32_t& subject,
                                   const block_height_t timestamp,
                                   const signature_envelope_t& envelope,
                                   const account_id_t& caller) {
  auto digest = make_operation_digest(encoder_, options_.registry_id,
                                      operation, id, subject, timestamp);
  auto signer = signature_verifier_(
      bytes_view_t{digest.data(), digest.size()}, envelope);
  if (!signer) {
    return error_code_t::signature_invalid;
  }
  if (*signer != caller) {
    return error_code_t::signer_mismatch;
  }
  return error_code_t::ok;
}

error_code_t engine::check_recent(const block_height_t timestamp,
                                  const block_height_t now) const {
  if (timestamp > now) {
    return error_code_t::future_timestamp;
  }
  if (!guards::is_recent(timestamp, now, options_.recent_window)) {
    return error_code_t::stale_timestamp;
  }
  return error_code_t::ok;
}

void engine::commit(const allocation_t& expected,
                    const allocation_t& replacement) {
  if (!storage_.compare_and_swap(expected, replacement)) {
    custodia::common::critical(
        "Store changed under allocation {} during an operation",
        expected.allocation_id);
  }
}

void engine::emit(const operation_type_t operation,
                  const call_context& context,
                  const allocation_id_t id,
                  std::vector<audit_event_attribute_t> attributes) {
  auto event = audit_event_t{.sequence = ++audit_sequence_,
                             .height = context.now,
                             .type = operation,
                             .allocation_id = id,
                             .caller = context.caller,
                             .attributes = std::move(attributes)};
  spdlog::debug("Committed {} on allocation {} at height {}",
                to_string(operation), id, context.now);
  pending_event_ = std::move(event);
}

operation_result_t engine::reject(
    const operation_type_t operation,
    const error_code_t code,
    const std::optional<allocation_id_t> id) const {
  spdlog::debug("Rejected {} on allocation {}: {}", to_string(operation),
                id.value_or(0), to_string(code));
  return operation_result_t{.code = static_cast<uint32_t>(code),
                            .log = std::string{to_string(code)},
                            .codespace = std::string{kCodespace},
                            .allocation_id = id};
}

operation_result_t engine::success(const allocation_t& record) const {
  return operation_result_t{.code = 0,
                            .log = "ok",
                            .codespace = std::string{kCodespace},
                            .allocation_id = record.allocation_id,
                            .status = record.status};
}

}  // namespace custodia::execution
