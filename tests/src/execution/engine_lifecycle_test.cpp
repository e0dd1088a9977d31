#include <custodia/execution/engine.hpp>
#include <custodia/execution/transition_table.hpp>
#include <custodia/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <set>
#include <vector>

using custodia::schema::allocation_status_t;
using custodia::schema::amount_t;
using custodia::schema::error_code_t;
using custodia::schema::error_kind_t;
using custodia::schema::operation_type_t;
using custodia::testing::code_of;
using custodia::testing::engine_fixture;

namespace schema = custodia::schema;

TEST(engine_lifecycle, create_escrows_funds_and_assigns_sequential_ids) {
  auto fixture = engine_fixture{};
  auto first = fixture.create(1000, 100);
  auto second = fixture.create(250, 10);
  EXPECT_EQ(first, 1u);
  EXPECT_EQ(second, 2u);
  EXPECT_EQ(fixture.engine().last_allocation_id(), 2u);

  auto record = fixture.load(first);
  EXPECT_EQ(record.originator, engine_fixture::originator());
  EXPECT_EQ(record.beneficiary, engine_fixture::beneficiary());
  EXPECT_EQ(record.resource_id, 7u);
  EXPECT_EQ(record.quantity, amount_t{1000});
  EXPECT_EQ(record.status, allocation_status_t::pending);
  EXPECT_EQ(record.genesis_block, engine_fixture::kStartHeight);
  EXPECT_EQ(record.termination_block, engine_fixture::kStartHeight + 100);

  EXPECT_EQ(fixture.ledger().balance(engine_fixture::custodian()),
            amount_t{1250});
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::originator()),
            amount_t{1'000'000 - 1250});
  ASSERT_EQ(fixture.events().size(), 2u);
  EXPECT_EQ(fixture.events()[0].type, operation_type_t::create_allocation);
  EXPECT_EQ(fixture.events()[0].sequence, 1u);
  EXPECT_EQ(fixture.events()[1].sequence, 2u);
  EXPECT_EQ(fixture.engine().allocations().size(), 2u);
}

TEST(engine_lifecycle, accepted_allocation_finalizes_once) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);

  auto accepted = fixture.run(engine_fixture::beneficiary(),
                              schema::accept_allocation_t{.allocation_id = id});
  ASSERT_EQ(accepted.code, 0u) << accepted.log;
  EXPECT_EQ(accepted.status, allocation_status_t::accepted);

  auto finalized = fixture.run(
      engine_fixture::supervisor(),
      schema::finalize_allocation_t{.allocation_id = id});
  ASSERT_EQ(finalized.code, 0u) << finalized.log;
  EXPECT_EQ(finalized.status, allocation_status_t::completed);
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::beneficiary()),
            amount_t{1000});
  EXPECT_EQ(fixture.load(id).quantity, amount_t{0});

  auto again = fixture.run(engine_fixture::supervisor(),
                           schema::finalize_allocation_t{.allocation_id = id});
  EXPECT_EQ(again.code, code_of(error_code_t::not_active));
  EXPECT_EQ(schema::kind_of(static_cast<error_code_t>(again.code)),
            error_kind_t::already_processed);
  EXPECT_EQ(again.codespace, "custodia.engine");
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::beneficiary()),
            amount_t{1000});
}

TEST(engine_lifecycle, originator_may_finalize_a_pending_allocation) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(400, 100);
  auto finalized = fixture.run(
      engine_fixture::originator(),
      schema::finalize_allocation_t{.allocation_id = id});
  ASSERT_EQ(finalized.code, 0u) << finalized.log;
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::beneficiary()),
            amount_t{400});
}

TEST(engine_lifecycle, lapsed_allocation_is_reclaimed_once) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);

  auto early = fixture.run(engine_fixture::originator(),
                           schema::reclaim_lapsed_t{.allocation_id = id});
  EXPECT_EQ(early.code, code_of(error_code_t::not_lapsed));

  fixture.advance(101);
  auto reclaimed = fixture.run(engine_fixture::originator(),
                               schema::reclaim_lapsed_t{.allocation_id = id});
  ASSERT_EQ(reclaimed.code, 0u) << reclaimed.log;
  EXPECT_EQ(reclaimed.status, allocation_status_t::expired);
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::originator()),
            amount_t{1'000'000});

  auto again = fixture.run(engine_fixture::originator(),
                           schema::reclaim_lapsed_t{.allocation_id = id});
  EXPECT_EQ(schema::kind_of(static_cast<error_code_t>(again.code)),
            error_kind_t::already_processed);
}

TEST(engine_lifecycle, arbitration_splits_with_floor_and_closes_dispute) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);

  auto challenged = fixture.run(
      engine_fixture::beneficiary(),
      schema::challenge_allocation_t{.allocation_id = id});
  ASSERT_EQ(challenged.code, 0u) << challenged.log;

  auto bad = fixture.run(engine_fixture::supervisor(),
                         schema::arbitrate_allocation_t{
                             .allocation_id = id, .originator_percentage = 101});
  EXPECT_EQ(bad.code, code_of(error_code_t::invalid_percentage));

  auto arbitrated = fixture.run(
      engine_fixture::supervisor(),
      schema::arbitrate_allocation_t{.allocation_id = id,
                                     .originator_percentage = 30});
  ASSERT_EQ(arbitrated.code, 0u) << arbitrated.log;
  EXPECT_EQ(arbitrated.status, allocation_status_t::arbitrated);
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::originator()),
            amount_t{1'000'000 - 1000 + 300});
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::beneficiary()),
            amount_t{700});
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::custodian()),
            amount_t{0});

  auto again = fixture.run(engine_fixture::supervisor(),
                           schema::arbitrate_allocation_t{
                               .allocation_id = id, .originator_percentage = 30});
  EXPECT_EQ(again.code, code_of(error_code_t::not_challenged));
}

TEST(engine_lifecycle, arbitration_at_zero_percent_pays_only_beneficiary) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);
  ASSERT_EQ(fixture
                .run(engine_fixture::originator(),
                     schema::challenge_allocation_t{.allocation_id = id})
                .code,
            0u);
  auto attempts = fixture.ledger().attempts();
  auto result = fixture.run(engine_fixture::supervisor(),
                            schema::arbitrate_allocation_t{
                                .allocation_id = id, .originator_percentage = 0});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(fixture.ledger().attempts(), attempts + 1);
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::beneficiary()),
            amount_t{1000});
}

TEST(engine_lifecycle, deadline_boundary_is_inside_the_window) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);
  fixture.set_height(engine_fixture::kStartHeight + 100);
  auto at_deadline = fixture.run(
      engine_fixture::beneficiary(),
      schema::accept_allocation_t{.allocation_id = id});
  EXPECT_EQ(at_deadline.code, 0u) << at_deadline.log;

  fixture.advance(1);
  auto late = fixture.run(engine_fixture::supervisor(),
                          schema::finalize_allocation_t{.allocation_id = id});
  EXPECT_EQ(late.code, code_of(error_code_t::lapsed));
  EXPECT_EQ(fixture.load(id).status, allocation_status_t::accepted);
}

namespace {

struct windowed_call final {
  operation_type_t operation;
  schema::account_id_t caller;
  schema::operation_payload_t payload;
};

// Allocation 1 is the only record in a fresh fixture.
std::vector<windowed_call> windowed_calls() {
  constexpr auto id = schema::allocation_id_t{1};
  return {
      {operation_type_t::accept, engine_fixture::beneficiary(),
       schema::accept_allocation_t{.allocation_id = id}},
      {operation_type_t::finalize, engine_fixture::supervisor(),
       schema::finalize_allocation_t{.allocation_id = id}},
      {operation_type_t::terminate, engine_fixture::originator(),
       schema::terminate_allocation_t{.allocation_id = id}},
      {operation_type_t::challenge, engine_fixture::beneficiary(),
       schema::challenge_allocation_t{.allocation_id = id}},
      {operation_type_t::release_partial, engine_fixture::originator(),
       schema::release_partial_t{.allocation_id = id, .amount = 100}},
      {operation_type_t::release_installment, engine_fixture::supervisor(),
       schema::release_installment_t{.allocation_id = id, .percentage = 10}},
      {operation_type_t::top_up, engine_fixture::originator(),
       schema::top_up_allocation_t{.allocation_id = id, .amount = 100}},
      {operation_type_t::extend_deadline, engine_fixture::originator(),
       schema::extend_deadline_t{.allocation_id = id,
                                 .additional_blocks = 10}}};
}

}  // namespace

TEST(engine_lifecycle, windowed_calls_cover_every_deadline_bound_rule) {
  auto bound = std::set<operation_type_t>{};
  for (const auto& rule : custodia::execution::kTransitionRules) {
    if (rule.deadline == custodia::execution::deadline_policy_t::within) {
      bound.insert(rule.operation);
    }
  }
  auto covered = std::set<operation_type_t>{};
  for (const auto& call : windowed_calls()) {
    covered.insert(call.operation);
  }
  EXPECT_EQ(covered, bound);
}

TEST(engine_lifecycle, every_windowed_operation_succeeds_at_the_deadline) {
  for (const auto& call : windowed_calls()) {
    auto fixture = engine_fixture{};
    ASSERT_EQ(fixture.create(1000, 100), 1u);
    fixture.set_height(engine_fixture::kStartHeight + 100);
    auto result = fixture.run(call.caller, call.payload);
    EXPECT_EQ(result.code, 0u)
        << schema::to_string(call.operation) << ": " << result.log;
  }
}

TEST(engine_lifecycle, every_windowed_operation_lapses_after_the_deadline) {
  for (const auto& call : windowed_calls()) {
    auto fixture = engine_fixture{};
    ASSERT_EQ(fixture.create(1000, 100), 1u);
    const auto before = fixture.load(1);
    const auto events = fixture.events().size();
    fixture.set_height(engine_fixture::kStartHeight + 101);

    auto result = fixture.run(call.caller, call.payload);
    EXPECT_EQ(result.code, code_of(error_code_t::lapsed))
        << schema::to_string(call.operation);
    EXPECT_EQ(fixture.load(1), before) << schema::to_string(call.operation);
    EXPECT_EQ(fixture.events().size(), events);
    EXPECT_EQ(fixture.ledger().balance(engine_fixture::custodian()),
              amount_t{1000});
  }
}

TEST(engine_lifecycle, revert_and_terminate_refund_the_originator) {
  auto fixture = engine_fixture{};
  auto reverted_id = fixture.create(300, 100);
  auto terminated_id = fixture.create(200, 100);

  auto reverted = fixture.run(
      engine_fixture::supervisor(),
      schema::revert_allocation_t{.allocation_id = reverted_id});
  ASSERT_EQ(reverted.code, 0u) << reverted.log;
  EXPECT_EQ(reverted.status, allocation_status_t::reverted);

  auto terminated = fixture.run(
      engine_fixture::originator(),
      schema::terminate_allocation_t{.allocation_id = terminated_id});
  ASSERT_EQ(terminated.code, 0u) << terminated.log;
  EXPECT_EQ(terminated.status, allocation_status_t::terminated);
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::originator()),
            amount_t{1'000'000});
}

TEST(engine_lifecycle, revert_requires_pending) {
  auto fixture = engine_fixture{};
  auto id = fixture.create();
  ASSERT_EQ(fixture
                .run(engine_fixture::beneficiary(),
                     schema::accept_allocation_t{.allocation_id = id})
                .code,
            0u);
  auto result = fixture.run(engine_fixture::supervisor(),
                            schema::revert_allocation_t{.allocation_id = id});
  EXPECT_EQ(result.code, code_of(error_code_t::not_pending));
}

TEST(engine_lifecycle, suspensions_exit_back_to_pending) {
  auto fixture = engine_fixture{};
  auto id = fixture.create();

  auto frozen = fixture.run(engine_fixture::beneficiary(),
                            schema::emergency_freeze_t{.allocation_id = id});
  ASSERT_EQ(frozen.code, 0u) << frozen.log;
  auto refrozen = fixture.run(engine_fixture::originator(),
                              schema::emergency_freeze_t{.allocation_id = id});
  EXPECT_EQ(refrozen.code, code_of(error_code_t::not_freezable));
  auto originator_unfreeze = fixture.run(
      engine_fixture::originator(),
      schema::unfreeze_allocation_t{.allocation_id = id});
  EXPECT_EQ(originator_unfreeze.code, code_of(error_code_t::unauthorized));
  auto unfrozen = fixture.run(
      engine_fixture::supervisor(),
      schema::unfreeze_allocation_t{.allocation_id = id});
  ASSERT_EQ(unfrozen.code, 0u) << unfrozen.log;
  EXPECT_EQ(unfrozen.status, allocation_status_t::pending);

  auto locked = fixture.run(
      engine_fixture::originator(),
      schema::lock_for_investigation_t{.allocation_id = id});
  ASSERT_EQ(locked.code, 0u) << locked.log;
  auto not_paused = fixture.run(engine_fixture::originator(),
                                schema::resume_allocation_t{.allocation_id = id});
  EXPECT_EQ(not_paused.code, code_of(error_code_t::not_paused));
  auto concluded = fixture.run(
      engine_fixture::supervisor(),
      schema::conclude_investigation_t{.allocation_id = id});
  ASSERT_EQ(concluded.code, 0u) << concluded.log;

  auto paused = fixture.run(engine_fixture::beneficiary(),
                            schema::pause_allocation_t{.allocation_id = id});
  ASSERT_EQ(paused.code, 0u) << paused.log;
  auto blocked = fixture.run(engine_fixture::supervisor(),
                             schema::finalize_allocation_t{.allocation_id = id});
  EXPECT_EQ(blocked.code, code_of(error_code_t::not_active));
  auto resumed = fixture.run(engine_fixture::originator(),
                             schema::resume_allocation_t{.allocation_id = id});
  ASSERT_EQ(resumed.code, 0u) << resumed.log;
  EXPECT_EQ(resumed.status, allocation_status_t::pending);
}

TEST(engine_lifecycle, security_hold_extends_the_deadline) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);

  auto too_long = fixture.run(
      engine_fixture::supervisor(),
      schema::add_security_hold_t{
          .allocation_id = id,
          .hold_duration =
              engine_fixture::default_options().max_hold_duration + 1});
  EXPECT_EQ(too_long.code, code_of(error_code_t::invalid_duration));
  auto zero = fixture.run(
      engine_fixture::supervisor(),
      schema::add_security_hold_t{.allocation_id = id, .hold_duration = 0});
  EXPECT_EQ(zero.code, code_of(error_code_t::invalid_duration));

  auto held = fixture.run(
      engine_fixture::supervisor(),
      schema::add_security_hold_t{.allocation_id = id, .hold_duration = 50});
  ASSERT_EQ(held.code, 0u) << held.log;
  EXPECT_EQ(held.status, allocation_status_t::held);
  EXPECT_EQ(fixture.load(id).termination_block,
            engine_fixture::kStartHeight + 150);

  auto released = fixture.run(
      engine_fixture::supervisor(),
      schema::release_security_hold_t{.allocation_id = id});
  ASSERT_EQ(released.code, 0u) << released.log;
  EXPECT_EQ(released.status, allocation_status_t::pending);
}

TEST(engine_lifecycle, timelocked_funds_are_retrieved_after_the_deadline) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);
  const auto deadline = engine_fixture::kStartHeight + 100;

  auto beyond = fixture.run(engine_fixture::originator(),
                            schema::establish_timelock_t{
                                .allocation_id = id,
                                .unlock_height = deadline + 1});
  EXPECT_EQ(beyond.code, code_of(error_code_t::invalid_unlock_height));

  auto locked = fixture.run(
      engine_fixture::originator(),
      schema::establish_timelock_t{.allocation_id = id,
                                   .unlock_height = deadline});
  ASSERT_EQ(locked.code, 0u) << locked.log;
  EXPECT_EQ(locked.status, allocation_status_t::timelocked);

  auto early = fixture.run(engine_fixture::beneficiary(),
                           schema::retrieve_allocation_t{.allocation_id = id});
  EXPECT_EQ(early.code, code_of(error_code_t::not_lapsed));

  fixture.set_height(deadline + 1);
  auto by_originator = fixture.run(
      engine_fixture::originator(),
      schema::retrieve_allocation_t{.allocation_id = id});
  EXPECT_EQ(by_originator.code, code_of(error_code_t::unauthorized));
  auto retrieved = fixture.run(
      engine_fixture::beneficiary(),
      schema::retrieve_allocation_t{.allocation_id = id});
  ASSERT_EQ(retrieved.code, 0u) << retrieved.log;
  EXPECT_EQ(retrieved.status, allocation_status_t::retrieved);
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::beneficiary()),
            amount_t{1000});
}

TEST(engine_lifecycle, partial_releases_complete_when_drained) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);

  auto zero = fixture.run(
      engine_fixture::originator(),
      schema::release_partial_t{.allocation_id = id, .amount = 0});
  EXPECT_EQ(zero.code, code_of(error_code_t::invalid_quantity));

  auto first = fixture.run(
      engine_fixture::originator(),
      schema::release_partial_t{.allocation_id = id, .amount = 400});
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_EQ(first.status, allocation_status_t::pending);
  EXPECT_EQ(fixture.load(id).quantity, amount_t{600});

  auto too_much = fixture.run(
      engine_fixture::supervisor(),
      schema::release_partial_t{.allocation_id = id, .amount = 601});
  EXPECT_EQ(too_much.code, code_of(error_code_t::insufficient_quantity));

  auto rest = fixture.run(
      engine_fixture::supervisor(),
      schema::release_partial_t{.allocation_id = id, .amount = 600});
  ASSERT_EQ(rest.code, 0u) << rest.log;
  EXPECT_EQ(rest.status, allocation_status_t::completed);
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::beneficiary()),
            amount_t{1000});
}

TEST(engine_lifecycle, installments_release_a_floored_percentage) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);

  auto quarter = fixture.run(
      engine_fixture::originator(),
      schema::release_installment_t{.allocation_id = id, .percentage = 25});
  ASSERT_EQ(quarter.code, 0u) << quarter.log;
  EXPECT_EQ(fixture.load(id).quantity, amount_t{750});

  auto invalid = fixture.run(
      engine_fixture::originator(),
      schema::release_installment_t{.allocation_id = id, .percentage = 0});
  EXPECT_EQ(invalid.code, code_of(error_code_t::invalid_percentage));

  auto all = fixture.run(
      engine_fixture::originator(),
      schema::release_installment_t{.allocation_id = id, .percentage = 100});
  ASSERT_EQ(all.code, 0u) << all.log;
  EXPECT_EQ(all.status, allocation_status_t::completed);

  auto tiny = fixture.create(1, 100);
  auto dust = fixture.run(
      engine_fixture::originator(),
      schema::release_installment_t{.allocation_id = tiny, .percentage = 50});
  EXPECT_EQ(dust.code, code_of(error_code_t::dust_release));
}

TEST(engine_lifecycle, top_up_and_extension_grow_the_allocation) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);

  auto topped = fixture.run(
      engine_fixture::originator(),
      schema::top_up_allocation_t{.allocation_id = id, .amount = 500});
  ASSERT_EQ(topped.code, 0u) << topped.log;
  EXPECT_EQ(fixture.load(id).quantity, amount_t{1500});
  EXPECT_EQ(fixture.ledger().balance(engine_fixture::custodian()),
            amount_t{1500});

  auto by_supervisor = fixture.run(
      engine_fixture::supervisor(),
      schema::top_up_allocation_t{.allocation_id = id, .amount = 1});
  EXPECT_EQ(by_supervisor.code, code_of(error_code_t::unauthorized));

  auto overflow = fixture.run(
      engine_fixture::originator(),
      schema::top_up_allocation_t{
          .allocation_id = id,
          .amount = std::numeric_limits<amount_t>::max()});
  EXPECT_EQ(overflow.code, code_of(error_code_t::quantity_overflow));

  auto extended = fixture.run(
      engine_fixture::originator(),
      schema::extend_deadline_t{.allocation_id = id, .additional_blocks = 50});
  ASSERT_EQ(extended.code, 0u) << extended.log;
  EXPECT_EQ(fixture.load(id).termination_block,
            engine_fixture::kStartHeight + 150);

  auto nothing = fixture.run(
      engine_fixture::originator(),
      schema::extend_deadline_t{.allocation_id = id, .additional_blocks = 0});
  EXPECT_EQ(nothing.code, code_of(error_code_t::invalid_duration));

  auto wrap = fixture.run(
      engine_fixture::originator(),
      schema::extend_deadline_t{
          .allocation_id = id,
          .additional_blocks =
              std::numeric_limits<schema::block_height_t>::max()});
  EXPECT_EQ(wrap.code, code_of(error_code_t::deadline_overflow));
}

TEST(engine_lifecycle, transfer_control_moves_originator_authority) {
  auto fixture = engine_fixture{};
  auto id = fixture.create(1000, 100);
  const auto heir = engine_fixture::outsider();

  auto to_beneficiary = fixture.run(
      engine_fixture::originator(),
      schema::transfer_control_t{.allocation_id = id,
                                 .new_originator =
                                     engine_fixture::beneficiary()});
  EXPECT_EQ(to_beneficiary.code, code_of(error_code_t::invalid_originator));
  auto to_custodian = fixture.run(
      engine_fixture::originator(),
      schema::transfer_control_t{.allocation_id = id,
                                 .new_originator = engine_fixture::custodian()});
  EXPECT_EQ(to_custodian.code, code_of(error_code_t::custodian_as_party));

  auto moved = fixture.run(
      engine_fixture::originator(),
      schema::transfer_control_t{.allocation_id = id, .new_originator = heir});
  ASSERT_EQ(moved.code, 0u) << moved.log;
  EXPECT_EQ(fixture.load(id).originator, heir);

  auto old_owner = fixture.run(
      engine_fixture::originator(),
      schema::terminate_allocation_t{.allocation_id = id});
  EXPECT_EQ(old_owner.code, code_of(error_code_t::unauthorized));
  auto new_owner = fixture.run(
      heir, schema::terminate_allocation_t{.allocation_id = id});
  ASSERT_EQ(new_owner.code, 0u) << new_owner.log;
  EXPECT_EQ(fixture.ledger().balance(heir), amount_t{1000});
}

TEST(engine_lifecycle, create_rejects_bad_parties_and_amounts) {
  auto fixture = engine_fixture{};
  auto create = [&](const schema::account_id_t& caller,
                    const schema::account_id_t& beneficiary,
                    const uint64_t quantity, const uint64_t duration) {
    return fixture.run(caller, schema::create_allocation_t{
                                   .beneficiary = beneficiary,
                                   .resource_id = 1,
                                   .quantity = quantity,
                                   .duration = duration});
  };
  const auto originator = engine_fixture::originator();
  const auto beneficiary = engine_fixture::beneficiary();

  EXPECT_EQ(create(engine_fixture::custodian(), beneficiary, 10, 10).code,
            code_of(error_code_t::custodian_as_party));
  EXPECT_EQ(create(originator, originator, 10, 10).code,
            code_of(error_code_t::invalid_beneficiary));
  EXPECT_EQ(create(originator, engine_fixture::custodian(), 10, 10).code,
            code_of(error_code_t::invalid_beneficiary));
  EXPECT_EQ(create(originator, beneficiary, 0, 10).code,
            code_of(error_code_t::invalid_quantity));
  EXPECT_EQ(create(originator, beneficiary, 10, 0).code,
            code_of(error_code_t::invalid_duration));
  EXPECT_EQ(create(originator, beneficiary, 10,
                   engine_fixture::default_options().max_duration + 1)
                .code,
            code_of(error_code_t::invalid_duration));
  EXPECT_EQ(fixture.engine().last_allocation_id(), 0u);
  EXPECT_TRUE(fixture.events().empty());
}

TEST(engine_lifecycle, create_rejects_a_deadline_past_the_height_range) {
  auto options = engine_fixture::default_options();
  options.max_duration = std::numeric_limits<schema::block_height_t>::max();
  auto fixture = engine_fixture{options};
  fixture.set_height(std::numeric_limits<schema::block_height_t>::max() - 5);
  auto result = fixture.run(engine_fixture::originator(),
                            schema::create_allocation_t{
                                .beneficiary = engine_fixture::beneficiary(),
                                .resource_id = 1,
                                .quantity = 10,
                                .duration = 6});
  EXPECT_EQ(result.code, code_of(error_code_t::deadline_overflow));
}
