#pragma once

#include <custodia/schema/encoding/scale/encoder.hpp>
#include <custodia/schema/operation_type.hpp>
#include <custodia/schema/primitives.hpp>

namespace custodia::execution {

/// Message a party signs to authorize a signature-bearing operation.
///
/// BLAKE3 over a domain tag followed by the SCALE encoding of
/// (registry id, operation code, allocation id, subject, timestamp).
/// `subject` is the caller for two-factor and multisig
/// approvals and the attestation hash for attestations.
custodia::schema::hash32_t make_operation_digest(
    custodia::schema::encoding::scale_encoder_t& encoder,
    const custodia::schema::hash32_t& registry_id,
    custodia::schema::operation_type_t operation,
    custodia::schema::allocation_id_t allocation_id,
    const custodia::schema::hash32_t& subject,
    custodia::schema::block_height_t timestamp);

}  // namespace custodia::execution
