#include <custodia/common/critical.hpp>
#include <custodia/execution/split.hpp>

namespace custodia::execution {

custodia::schema::amount_t percentage_of(
    const custodia::schema::amount_t& quantity,
    const uint8_t percentage) {
  if (percentage > 100) {
    custodia::common::critical("percentage above 100 reached split arithmetic");
  }
  auto p = custodia::schema::amount_t{percentage};
  return (quantity / 100) * p + ((quantity % 100) * p) / 100;
}

split_t split_quantity(const custodia::schema::amount_t& quantity,
                       const uint8_t originator_percentage) {
  auto originator_share = percentage_of(quantity, originator_percentage);
  return split_t{.originator_share = originator_share,
                 .beneficiary_share = quantity - originator_share};
}

}  // namespace custodia::execution
