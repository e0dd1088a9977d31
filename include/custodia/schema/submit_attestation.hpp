#pragma once
#include <custodia/schema/signature_envelope.hpp>
#include <custodia/schema/primitives.hpp>

// Schema type: submit attestation.
// Escrow workflow: Signed statement about the allocation, by content hash.
// Audit only.
namespace custodia::schema {

template <uint16_t Version>
struct submit_attestation;

template <>
struct submit_attestation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  hash32_t attestation_hash{};
  signature_envelope_t signature{};
};

using submit_attestation_t = submit_attestation<1>;

}  // namespace custodia::schema
