#pragma once

#include <custodia/execution/ledger.hpp>
#include <map>

namespace custodia::execution {

/// In-process ledger with a balance per account.
class memory_ledger final : public ledger {
 public:
  explicit memory_ledger(custodia::schema::account_id_t custodian);

  movement_result_t transfer(const custodia::schema::amount_t& amount,
                             const custodia::schema::account_id_t& from,
                             const custodia::schema::account_id_t& to) override;

  custodia::schema::account_id_t custodian_account() const override;

  /// Mint `amount` into `account`. Returns false, leaving the balance
  /// untouched, when the balance would exceed the 256-bit range.
  bool credit(const custodia::schema::account_id_t& account,
              const custodia::schema::amount_t& amount);

  custodia::schema::amount_t balance(
      const custodia::schema::account_id_t& account) const;

 private:
  custodia::schema::account_id_t custodian_;
  std::map<custodia::schema::account_id_t, custodia::schema::amount_t>
      balances_;
};

}  // namespace custodia::execution
