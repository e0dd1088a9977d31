#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: finalize allocation.
// Escrow workflow: Distribution: releases the full remaining quantity to the
// beneficiary.
namespace custodia::schema {

template <uint16_t Version>
struct finalize_allocation;

template <>
struct finalize_allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using finalize_allocation_t = finalize_allocation<1>;

}  // namespace custodia::schema
