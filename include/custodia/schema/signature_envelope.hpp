#pragma once

#include <custodia/schema/primitives.hpp>

// Schema type: signature envelope.
// Escrow workflow: a signature over an operation digest together with the
// public key it claims; the signer's account is derived from that key.
namespace custodia::schema {

template <uint16_t Version>
struct signature_envelope;

template <>
struct signature_envelope<1> final {
  uint16_t version{1};
  signer_id_t signer{};
  signature_t signature{};
};

using signature_envelope_t = signature_envelope<1>;

}  // namespace custodia::schema
