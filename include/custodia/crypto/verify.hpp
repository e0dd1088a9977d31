#pragma once

#include <custodia/schema/primitives.hpp>
#include <custodia/schema/signature_envelope.hpp>
#include <optional>

namespace custodia::crypto {

/// True when the linked OpenSSL provides both Ed25519 and secp256k1.
bool available();

bool verify_signature(const custodia::schema::bytes_view_t& message,
                      const custodia::schema::signer_id_t& signer,
                      const custodia::schema::signature_t& signature);

/// Registry account bound to a public key: BLAKE3 of a key-type tag byte
/// followed by the raw key.
custodia::schema::account_id_t account_from_signer(
    const custodia::schema::signer_id_t& signer);

/// Verify `envelope` over `digest` and return the signer's account, or
/// std::nullopt when the signature does not verify.
std::optional<custodia::schema::account_id_t> recover_signer(
    const custodia::schema::bytes_view_t& digest,
    const custodia::schema::signature_envelope_t& envelope);

}  // namespace custodia::crypto
