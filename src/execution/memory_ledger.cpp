#include <spdlog/spdlog.h>
#include <custodia/execution/memory_ledger.hpp>
#include <limits>
#include <utility>

namespace custodia::execution {

namespace {

bool fits(const custodia::schema::amount_t& balance,
          const custodia::schema::amount_t& amount) {
  return balance <= std::numeric_limits<custodia::schema::amount_t>::max() -
                        amount;
}

}  // namespace

memory_ledger::memory_ledger(custodia::schema::account_id_t custodian)
    : custodian_{std::move(custodian)} {}

movement_result_t memory_ledger::transfer(
    const custodia::schema::amount_t& amount,
    const custodia::schema::account_id_t& from,
    const custodia::schema::account_id_t& to) {
  if (amount == 0 || from == to) {
    return movement_result_t::rejected;
  }
  auto& source = balances_[from];
  if (source < amount) {
    spdlog::debug("Ledger transfer of {} from {} refused: balance {}",
                  amount.str(), custodia::schema::to_hex(from), source.str());
    return movement_result_t::insufficient_funds;
  }
  auto& target = balances_[to];
  if (!fits(target, amount)) {
    spdlog::debug(
        "Ledger transfer of {} to {} refused: balance {} would overflow",
        amount.str(), custodia::schema::to_hex(to), target.str());
    return movement_result_t::rejected;
  }
  source -= amount;
  target += amount;
  return movement_result_t::completed;
}

custodia::schema::account_id_t memory_ledger::custodian_account() const {
  return custodian_;
}

bool memory_ledger::credit(const custodia::schema::account_id_t& account,
                           const custodia::schema::amount_t& amount) {
  auto& balance = balances_[account];
  if (!fits(balance, amount)) {
    return false;
  }
  balance += amount;
  return true;
}

custodia::schema::amount_t memory_ledger::balance(
    const custodia::schema::account_id_t& account) const {
  auto it = balances_.find(account);
  if (it == std::end(balances_)) {
    return custodia::schema::amount_t{0};
  }
  return it->second;
}

}  // namespace custodia::execution
