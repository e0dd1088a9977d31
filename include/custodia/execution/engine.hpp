#pragma once

#include <custodia/execution/audit_sink.hpp>
#include <custodia/execution/height_source.hpp>
#include <custodia/execution/ledger.hpp>
#include <custodia/execution/signature_verifier.hpp>
#include <custodia/execution/transition_table.hpp>
#include <custodia/schema/allocation.hpp>
#include <custodia/schema/audit_event.hpp>
#include <custodia/schema/audit_event_attribute.hpp>
#include <custodia/schema/encoding/scale/encoder.hpp>
#include <custodia/schema/engine_options.hpp>
#include <custodia/schema/error_code.hpp>
#include <custodia/schema/operation.hpp>
#include <custodia/schema/operation_result.hpp>
#include <custodia/schema/primitives.hpp>
#include <custodia/storage/memory/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace custodia::execution {

/// Allocation registry and transition engine.
///
/// Every call to `execute` runs under one mutex: it reads the height once,
/// walks the guard chain (identifier, existence, authorization, status,
/// deadline, then operation-specific checks), moves value through the ledger,
/// commits the replacement record by compare-and-swap and emits exactly one
/// audit event. A rejected call leaves the store, the counter and the ledger
/// untouched. The mutex is not recursive: the ledger and the signature
/// verifier run inside it and must not re-enter the engine. The audit sink
/// runs after the mutex is released, so it may read the registry.
class engine final {
 public:
  /// `storage` and `ledger` must outlive the engine. The signature verifier
  /// defaults to OpenSSL verification of the envelope's public key.
  explicit engine(
      custodia::schema::encoding::scale_encoder_t& encoder,
      custodia::storage::memory_storage_t& storage,
      ledger& settlement,
      height_source_t height_source,
      custodia::schema::engine_options_t options,
      audit_sink_t audit_sink = log_audit_sink());

  custodia::schema::operation_result_t execute(
      const custodia::schema::account_id_t& caller,
      const custodia::schema::operation_payload_t& payload);

  std::optional<custodia::schema::allocation_t> allocation(
      custodia::schema::allocation_id_t id) const;

  custodia::schema::allocation_id_t last_allocation_id() const;

  std::vector<custodia::schema::allocation_t> allocations() const;

  const custodia::schema::engine_options_t& options() const;

  /// Replace the signature verifier used by signature-bearing operations.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  /// Per-call state shared by the handlers.
  struct call_context final {
    custodia::schema::account_id_t caller;
    custodia::schema::block_height_t now{};
  };

  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::create_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::accept_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::finalize_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::revert_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::terminate_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::reclaim_lapsed_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::emergency_freeze_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::lock_for_investigation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::challenge_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::arbitrate_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::pause_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::add_security_hold_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::establish_timelock_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::unfreeze_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::conclude_investigation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::resume_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::release_security_hold_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::retrieve_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::release_partial_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::release_installment_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::top_up_allocation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::extend_deadline_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::transfer_control_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::verify_two_factor_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::register_multisig_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::approve_multisig_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::submit_documentation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::submit_attestation_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::configure_rate_limit_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::register_oversight_t& payload);
  custodia::schema::operation_result_t apply(
      const call_context& context,
      const custodia::schema::set_priority_t& payload);

  /// Table-driven guard chain up to and including the deadline check.
  /// On success `record` holds the stored allocation.
  custodia::schema::error_code_t admit(
      const transition_rule& rule,
      const call_context& context,
      custodia::schema::allocation_id_t id,
      custodia::schema::allocation_t& record) const;

  /// Status change with an optional full payout, driven by the rule alone.
  custodia::schema::operation_result_t transition(
      custodia::schema::operation_type_t operation,
      const call_context& context,
      custodia::schema::allocation_id_t id);

  /// Shared tail of partial and installment releases: pay `amount` to the
  /// beneficiary and complete the allocation once nothing remains.
  custodia::schema::operation_result_t release_to_beneficiary(
      custodia::schema::operation_type_t operation,
      const call_context& context,
      const custodia::schema::allocation_t& record,
      const custodia::schema::amount_t& amount);

  /// Payout from custody to one party. Zero amounts never reach the ledger.
  movement_result_t pay_out(const custodia::schema::amount_t& amount,
                            const custodia::schema::account_id_t& to);

  /// Check a signature over the operation digest against the caller.
  custodia::schema::error_code_t verify_signer(
      custodia::schema::operation_type_t operation,
      custodia::schema::allocation_id_t id,
      const custodia::schema::hash32_t& subject,
      custodia::schema::block_height_t timestamp,
      const custodia::schema::signature_envelope_t& envelope,
      const custodia::schema::account_id_t& caller);

  custodia::schema::error_code_t check_recent(
      custodia::schema::block_height_t timestamp,
      custodia::schema::block_height_t now) const;

  /// Compare-and-swap the replacement into the store; a mismatch is fatal.
  void commit(const custodia::schema::allocation_t& expected,
              const custodia::schema::allocation_t& replacement);

  void emit(custodia::schema::operation_type_t operation,
            const call_context& context,
            custodia::schema::allocation_id_t id,
            std::vector<custodia::schema::audit_event_attribute_t> attributes);

  custodia::schema::operation_result_t reject(
      custodia::schema::operation_type_t operation,
      custodia::schema::error_code_t code,
      std::optional<custodia::schema::allocation_id_t> id) const;

  custodia::schema::operation_result_t success(
      const custodia::schema::allocation_t& record) const;

  mutable std::mutex mutex_;
  custodia::schema::encoding::scale_encoder_t& encoder_;
  custodia::storage::memory_storage_t& storage_;
  ledger& ledger_;
  height_source_t height_source_;
  custodia::schema::engine_options_t options_;
  audit_sink_t audit_sink_;
  signature_verifier_t signature_verifier_;
  uint64_t audit_sequence_{};
  // Event committed by the running call, delivered once the mutex is free.
  std::optional<custodia::schema::audit_event_t> pending_event_;
};

}  // namespace custodia::execution
