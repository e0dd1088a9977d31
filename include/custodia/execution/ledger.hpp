#pragma once

#include <custodia/schema/primitives.hpp>
#include <cstdint>

namespace custodia::execution {

enum class movement_result_t : uint8_t {
  completed = 0,
  insufficient_funds = 1,
  rejected = 2
};

/// Settlement layer that holds escrowed value on behalf of the registry.
///
/// Every escrowed amount sits in `custodian_account()` between creation and
/// payout. Implementations must apply a transfer fully or not at all. The
/// engine calls `transfer` while holding its mutex, so an implementation must
/// not call back into the engine.
class ledger {
 public:
  virtual ~ledger() = default;

  virtual movement_result_t transfer(
      const custodia::schema::amount_t& amount,
      const custodia::schema::account_id_t& from,
      const custodia::schema::account_id_t& to) = 0;

  virtual custodia::schema::account_id_t custodian_account() const = 0;
};

}  // namespace custodia::execution
