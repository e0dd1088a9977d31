#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: release installment.
// Escrow workflow: Scheduled distribution of a percentage of the remaining
// quantity.
namespace custodia::schema {

template <uint16_t Version>
struct release_installment;

template <>
struct release_installment<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  uint8_t percentage{};
};

using release_installment_t = release_installment<1>;

}  // namespace custodia::schema
