#pragma once

#include <custodia/schema/primitives.hpp>
#include <cstdint>

namespace custodia::execution {

struct split_t final {
  custodia::schema::amount_t originator_share;
  custodia::schema::amount_t beneficiary_share;
};

/// floor(quantity * percentage / 100) without forming the full product.
/// `percentage` must be at most 100.
custodia::schema::amount_t percentage_of(
    const custodia::schema::amount_t& quantity,
    uint8_t percentage);

/// Originator receives the floored percentage, beneficiary the remainder.
/// The shares always sum to `quantity`.
split_t split_quantity(const custodia::schema::amount_t& quantity,
                       uint8_t originator_percentage);

}  // namespace custodia::execution
