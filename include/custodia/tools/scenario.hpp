#pragma once

#include <custodia/execution/engine.hpp>
#include <custodia/execution/memory_ledger.hpp>
#include <custodia/schema/encoding/scale/encoder.hpp>
#include <custodia/schema/engine_options.hpp>
#include <custodia/schema/operation.hpp>
#include <custodia/schema/operation_result.hpp>
#include <custodia/schema/primitives.hpp>
#include <custodia/storage/memory/storage.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace custodia::tools {

/// `fund <account> <amount>`: mint into an account on the in-memory ledger.
struct fund_step final {
  std::string label;
  custodia::schema::amount_t amount;
};

/// `advance <blocks>`: move the block height forward.
struct advance_step final {
  custodia::schema::block_height_t blocks{};
};

/// `<caller> <operation> <args...> [expect <code>]`
struct operation_step final {
  std::string caller;
  custodia::schema::operation_payload_t payload;
  std::optional<uint32_t> expected_code;
};

using scenario_step_t = std::variant<fund_step, advance_step, operation_step>;

/// Account id for a human-readable label: BLAKE3 of the label text.
custodia::schema::account_id_t account_for_label(std::string_view label);

/// Parse one scenario line. Blank lines and `#` comments yield std::nullopt
/// with `error` left empty; malformed lines yield std::nullopt and a message.
///
/// Signature-bearing operations (two-factor, multisig approval, attestation)
/// cannot be scripted.
std::optional<scenario_step_t> parse_scenario_line(std::string_view line,
                                                   std::string& error);

struct scenario_summary final {
  uint64_t steps{};
  uint64_t rejected{};
  uint64_t unexpected{};
  std::optional<std::string> parse_error;
};

/// In-memory registry driven by scenario steps.
class scenario_runner final {
 public:
  scenario_runner(custodia::schema::engine_options_t options,
                  const custodia::schema::account_id_t& custodian,
                  custodia::schema::block_height_t start_height);

  /// Execute one step; operation steps return the engine result.
  std::optional<custodia::schema::operation_result_t> run(
      const scenario_step_t& step);

  /// Parse and run `input` line by line, stopping at the first parse error.
  scenario_summary run_script(std::istream& input);

  custodia::execution::engine& registry();
  custodia::execution::memory_ledger& ledger();
  custodia::schema::block_height_t height() const;

 private:
  custodia::schema::encoding::scale_encoder_t encoder_;
  custodia::storage::memory_storage_t storage_;
  custodia::execution::memory_ledger ledger_;
  custodia::schema::block_height_t height_{};
  custodia::execution::engine engine_;
};

}  // namespace custodia::tools
