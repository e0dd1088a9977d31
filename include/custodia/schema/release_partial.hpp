#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: release partial.
// Escrow workflow: Partial distribution of a fixed amount to the beneficiary.
namespace custodia::schema {

template <uint16_t Version>
struct release_partial;

template <>
struct release_partial<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  amount_t amount{};
};

using release_partial_t = release_partial<1>;

}  // namespace custodia::schema
