#pragma once
#include <custodia/schema/signature_envelope.hpp>
#include <custodia/schema/primitives.hpp>

// Schema type: verify two factor.
// Escrow workflow: Second-factor confirmation by a party: a recent timestamp
// signed over the operation digest. Audit only.
namespace custodia::schema {

template <uint16_t Version>
struct verify_two_factor;

template <>
struct verify_two_factor<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  block_height_t timestamp{};
  signature_envelope_t signature{};
};

using verify_two_factor_t = verify_two_factor<1>;

}  // namespace custodia::schema
