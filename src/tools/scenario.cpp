#include <spdlog/spdlog.h>
#include <custodia/blake3/hash.hpp>
#include <custodia/schema/operation_type.hpp>
#include <custodia/tools/scenario.hpp>

#include <charconv>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace custodia::tools {

namespace {

using custodia::schema::operation_type_t;

std::vector<std::string_view> split_tokens(std::string_view line) {
  auto tokens = std::vector<std::string_view>{};
  auto is_space = [](const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  };
  while (!line.empty()) {
    while (!line.empty() && is_space(line.front())) {
      line.remove_prefix(1);
    }
    auto end = std::size_t{0};
    while (end < line.size() && !is_space(line[end])) {
      ++end;
    }
    if (end > 0) {
      tokens.push_back(line.substr(0, end));
    }
    line.remove_prefix(end);
  }
  return tokens;
}

template <typename T>
std::optional<T> parse_unsigned(const std::string_view token) {
  auto value = uint64_t{};
  auto [end, ec] =
      std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc{} || end != token.data() + token.size()) {
    return std::nullopt;
  }
  if (value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}

/// Cursor over the argument tokens of one operation line.
class arguments final {
 public:
  arguments(std::vector<std::string_view> tokens, std::string& error)
      : tokens_{std::move(tokens)}, error_{error} {}

  template <typename T>
  T number(const std::string_view name) {
    auto token = next(name);
    if (!token) {
      return T{};
    }
    auto value = parse_unsigned<uint64_t>(*token);
    if (!value) {
      fail(std::string{name} + " must be an unsigned number");
      return T{};
    }
    constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<T>::max());
    if (*value > kMax) {
      fail(std::string{name} + " is out of range (at most " +
           std::to_string(kMax) + ")");
      return T{};
    }
    return static_cast<T>(*value);
  }

  custodia::schema::amount_t amount(const std::string_view name) {
    auto token = next(name);
    if (!token) {
      return custodia::schema::amount_t{};
    }
    auto value = custodia::schema::try_make_amount(*token);
    if (!value) {
      fail(std::string{name} + " must be a decimal amount");
      return custodia::schema::amount_t{};
    }
    return *value;
  }

  custodia::schema::account_id_t account(const std::string_view name) {
    auto token = next(name);
    if (!token) {
      return custodia::schema::account_id_t{};
    }
    return account_for_label(*token);
  }

  /// 64 hex characters are taken verbatim; any other text is hashed.
  custodia::schema::hash32_t reference(const std::string_view name) {
    auto token = next(name);
    if (!token) {
      return custodia::schema::hash32_t{};
    }
    if (auto hash = custodia::schema::try_make_hash32(*token)) {
      return *hash;
    }
    return custodia::blake3::hash(*token);
  }

  std::vector<custodia::schema::account_id_t> remaining_accounts() {
    auto accounts = std::vector<custodia::schema::account_id_t>{};
    while (position_ < tokens_.size()) {
      accounts.push_back(account_for_label(tokens_[position_++]));
    }
    return accounts;
  }

  bool finish() {
    if (error_.empty() && position_ != tokens_.size()) {
      fail("unexpected argument '" + std::string{tokens_[position_]} + "'");
    }
    return error_.empty();
  }

 private:
  std::optional<std::string_view> next(const std::string_view name) {
    if (!error_.empty()) {
      return std::nullopt;
    }
    if (position_ >= tokens_.size()) {
      fail("missing " + std::string{name});
      return std::nullopt;
    }
    return tokens_[position_++];
  }

  void fail(std::string message) {
    if (error_.empty()) {
      error_ = std::move(message);
    }
  }

  std::vector<std::string_view> tokens_;
  std::size_t position_{};
  std::string& error_;
};

std::optional<custodia::schema::operation_payload_t> build_payload(
    const operation_type_t operation,
    arguments& args,
    std::string& error) {
  using namespace custodia::schema;
  switch (operation) {
    case operation_type_t::create_allocation: {
      auto payload = create_allocation_t{};
      payload.beneficiary = args.account("beneficiary");
      payload.resource_id = args.number<resource_id_t>("resource");
      payload.quantity = args.amount("quantity");
      payload.duration = args.number<block_height_t>("duration");
      return payload;
    }
    case operation_type_t::accept:
      return accept_allocation_t{.allocation_id =
                                     args.number<allocation_id_t>("id")};
    case operation_type_t::finalize:
      return finalize_allocation_t{.allocation_id =
                                       args.number<allocation_id_t>("id")};
    case operation_type_t::revert:
      return revert_allocation_t{.allocation_id =
                                     args.number<allocation_id_t>("id")};
    case operation_type_t::terminate:
      return terminate_allocation_t{.allocation_id =
                                        args.number<allocation_id_t>("id")};
    case operation_type_t::reclaim_lapsed:
      return reclaim_lapsed_t{.allocation_id =
                                  args.number<allocation_id_t>("id")};
    case operation_type_t::emergency_freeze:
      return emergency_freeze_t{.allocation_id =
                                    args.number<allocation_id_t>("id")};
    case operation_type_t::lock_for_investigation:
      return lock_for_investigation_t{
          .allocation_id = args.number<allocation_id_t>("id")};
    case operation_type_t::challenge:
      return challenge_allocation_t{.allocation_id =
                                        args.number<allocation_id_t>("id")};
    case operation_type_t::arbitrate: {
      auto payload = arbitrate_allocation_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.originator_percentage = args.number<uint8_t>("percentage");
      return payload;
    }
    case operation_type_t::pause:
      return pause_allocation_t{.allocation_id =
                                    args.number<allocation_id_t>("id")};
    case operation_type_t::add_security_hold: {
      auto payload = add_security_hold_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.hold_duration = args.number<block_height_t>("hold duration");
      return payload;
    }
    case operation_type_t::establish_timelock: {
      auto payload = establish_timelock_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.unlock_height = args.number<block_height_t>("unlock height");
      return payload;
    }
    case operation_type_t::unfreeze:
      return unfreeze_allocation_t{.allocation_id =
                                       args.number<allocation_id_t>("id")};
    case operation_type_t::conclude_investigation:
      return conclude_investigation_t{
          .allocation_id = args.number<allocation_id_t>("id")};
    case operation_type_t::resume:
      return resume_allocation_t{.allocation_id =
                                     args.number<allocation_id_t>("id")};
    case operation_type_t::release_security_hold:
      return release_security_hold_t{
          .allocation_id = args.number<allocation_id_t>("id")};
    case operation_type_t::retrieve:
      return retrieve_allocation_t{.allocation_id =
                                       args.number<allocation_id_t>("id")};
    case operation_type_t::release_partial: {
      auto payload = release_partial_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.amount = args.amount("amount");
      return payload;
    }
    case operation_type_t::release_installment: {
      auto payload = release_installment_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.percentage = args.number<uint8_t>("percentage");
      return payload;
    }
    case operation_type_t::top_up: {
      auto payload = top_up_allocation_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.amount = args.amount("amount");
      return payload;
    }
    case operation_type_t::extend_deadline: {
      auto payload = extend_deadline_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.additional_blocks = args.number<block_height_t>("blocks");
      return payload;
    }
    case operation_type_t::transfer_control: {
      auto payload = transfer_control_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.new_originator = args.account("new originator");
      return payload;
    }
    case operation_type_t::register_multisig: {
      auto payload = register_multisig_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.threshold = args.number<uint32_t>("threshold");
      payload.signers = args.remaining_accounts();
      return payload;
    }
    case operation_type_t::submit_documentation: {
      auto payload = submit_documentation_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.document_hash = args.reference("document");
      payload.timestamp = args.number<block_height_t>("timestamp");
      return payload;
    }
    case operation_type_t::configure_rate_limit: {
      auto payload = configure_rate_limit_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.max_operations = args.number<uint32_t>("max operations");
      payload.window_blocks = args.number<block_height_t>("window");
      return payload;
    }
    case operation_type_t::register_oversight: {
      auto payload = register_oversight_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.monitor = args.account("monitor");
      return payload;
    }
    case operation_type_t::set_priority: {
      auto payload = set_priority_t{};
      payload.allocation_id = args.number<allocation_id_t>("id");
      payload.level = args.number<uint8_t>("level");
      return payload;
    }
    case operation_type_t::verify_two_factor:
    case operation_type_t::approve_multisig:
    case operation_type_t::submit_attestation:
      error = std::string{to_string(operation)} +
              " needs a signature and cannot be scripted";
      return std::nullopt;
  }
  error = "unknown operation";
  return std::nullopt;
}

}  // namespace

custodia::schema::account_id_t account_for_label(const std::string_view label) {
  return custodia::blake3::hash(label);
}

std::optional<scenario_step_t> parse_scenario_line(const std::string_view line,
                                                   std::string& error) {
  error.clear();
  auto tokens = split_tokens(line);
  if (tokens.empty() || tokens.front().starts_with('#')) {
    return std::nullopt;
  }

  if (tokens.front() == "fund") {
    if (tokens.size() != 3) {
      error = "usage: fund <account> <amount>";
      return std::nullopt;
    }
    auto amount = custodia::schema::try_make_amount(tokens[2]);
    if (!amount) {
      error = "fund amount must be a decimal amount";
      return std::nullopt;
    }
    return fund_step{.label = std::string{tokens[1]}, .amount = *amount};
  }
  if (tokens.front() == "advance") {
    auto blocks = tokens.size() == 2
                      ? parse_unsigned<custodia::schema::block_height_t>(
                            tokens[1])
                      : std::nullopt;
    if (!blocks) {
      error = "usage: advance <blocks>";
      return std::nullopt;
    }
    return advance_step{.blocks = *blocks};
  }

  if (tokens.size() < 2) {
    error = "usage: <caller> <operation> <args...>";
    return std::nullopt;
  }
  auto operation =
      custodia::schema::try_from_string<operation_type_t>(tokens[1]);
  if (!operation) {
    error = "unknown operation '" + std::string{tokens[1]} + "'";
    return std::nullopt;
  }

  auto expected_code = std::optional<uint32_t>{};
  auto end = tokens.size();
  if (end >= 4 && tokens[end - 2] == "expect") {
    expected_code = tokens[end - 1] == "ok"
                        ? std::optional<uint32_t>{0}
                        : parse_unsigned<uint32_t>(tokens[end - 1]);
    if (!expected_code) {
      error = "expect takes 'ok' or a numeric error code";
      return std::nullopt;
    }
    end -= 2;
  }

  auto args = arguments{
      std::vector<std::string_view>{std::begin(tokens) + 2,
                                    std::begin(tokens) + end},
      error};
  auto payload = build_payload(*operation, args, error);
  if (!payload || !args.finish()) {
    return std::nullopt;
  }
  return operation_step{.caller = std::string{tokens[0]},
                        .payload = std::move(*payload),
                        .expected_code = expected_code};
}

scenario_runner::scenario_runner(
    custodia::schema::engine_options_t options,
    const custodia::schema::account_id_t& custodian,
    const custodia::schema::block_height_t start_height)
    : storage_{custodia::storage::make_storage<
          custodia::storage::memory_storage_tag>()},
      ledger_{custodian},
      height_{start_height},
      engine_{encoder_, storage_, ledger_, [this] { return height_; },
              std::move(options)} {}

std::optional<custodia::schema::operation_result_t> scenario_runner::run(
    const scenario_step_t& step) {
  return std::visit(
      overloaded{
          [&](const fund_step& fund)
              -> std::optional<custodia::schema::operation_result_t> {
            if (!ledger_.credit(account_for_label(fund.label), fund.amount)) {
              spdlog::warn("fund {} {} refused: balance would overflow",
                           fund.label, fund.amount.str());
              return std::nullopt;
            }
            spdlog::info("fund {} {}", fund.label, fund.amount.str());
            return std::nullopt;
          },
          [&](const advance_step& advance)
              -> std::optional<custodia::schema::operation_result_t> {
            if (advance.blocks >
                std::numeric_limits<custodia::schema::block_height_t>::max() -
                    height_) {
              height_ =
                  std::numeric_limits<custodia::schema::block_height_t>::max();
            } else {
              height_ += advance.blocks;
            }
            spdlog::info("advance to height {}", height_);
            return std::nullopt;
          },
          [&](const operation_step& operation)
              -> std::optional<custodia::schema::operation_result_t> {
            auto result = engine_.execute(account_for_label(operation.caller),
                                          operation.payload);
            spdlog::info("{} -> code {} ({}) allocation {}", operation.caller,
                         result.code, result.log,
                         result.allocation_id.value_or(0));
            return result;
          }},
      step);
}

scenario_summary scenario_runner::run_script(std::istream& input) {
  auto summary = scenario_summary{};
  auto line = std::string{};
  auto line_number = uint64_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    auto error = std::string{};
    auto step = parse_scenario_line(line, error);
    if (!step) {
      if (!error.empty()) {
        summary.parse_error =
            "line " + std::to_string(line_number) + ": " + error;
        spdlog::error("Scenario parse error at {}", *summary.parse_error);
        return summary;
      }
      continue;
    }
    ++summary.steps;
    auto result = run(*step);
    if (!result) {
      continue;
    }
    if (result->code != 0) {
      ++summary.rejected;
    }
    const auto* operation = std::get_if<operation_step>(&*step);
    if (operation != nullptr && operation->expected_code &&
        *operation->expected_code != result->code) {
      ++summary.unexpected;
      spdlog::warn("line {}: expected code {}, got {}", line_number,
                   *operation->expected_code, result->code);
    }
  }
  return summary;
}

custodia::execution::engine& scenario_runner::registry() {
  return engine_;
}

custodia::execution::memory_ledger& scenario_runner::ledger() {
  return ledger_;
}

custodia::schema::block_height_t scenario_runner::height() const {
  return height_;
}

}  // namespace custodia::tools
