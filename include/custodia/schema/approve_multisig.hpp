#pragma once
#include <custodia/schema/signature_envelope.hpp>
#include <custodia/schema/primitives.hpp>

// Schema type: approve multisig.
// Escrow workflow: A party's signed approval of the allocation digest. Audit
// only.
namespace custodia::schema {

template <uint16_t Version>
struct approve_multisig;

template <>
struct approve_multisig<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  signature_envelope_t signature{};
};

using approve_multisig_t = approve_multisig<1>;

}  // namespace custodia::schema
