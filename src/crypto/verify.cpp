#include <custodia/blake3/hash.hpp>
#include <custodia/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace custodia::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

constexpr auto kEd25519Tag = uint8_t{0};
constexpr auto kSecp256k1Tag = uint8_t{1};

evp_pkey_ptr make_secp256k1_public_key(
    const custodia::schema::secp256k1_signer_id& signer) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* md,
                   const uint8_t* signature,
                   const std::size_t signature_size,
                   const custodia::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size, message.data(),
                          message.size()) == 1;
}

bool verify_ed25519(const custodia::schema::bytes_view_t& message,
                    const custodia::schema::ed25519_signer_id& signer,
                    const custodia::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), nullptr, signature.data(), signature.size(),
                       message);
}

// 65-byte secp256k1 signatures carry a recovery id either in front
// ([v || r || s]) or at the end ([r || s || v]). Valid ids are 0..3 or the
// legacy 27+ range. Both bytes can look like an id, so every plausible
// layout is returned, leading id first.
std::vector<std::array<uint8_t, 64>> compact_secp256k1_candidates(
    const custodia::schema::secp256k1_signature_t& signature) {
  const auto is_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  auto candidates = std::vector<std::array<uint8_t, 64>>{};
  if (is_recovery_id(signature[0])) {
    auto& out = candidates.emplace_back();
    std::copy_n(signature.data() + 1, out.size(), out.data());
  }
  if (is_recovery_id(signature[64])) {
    auto& out = candidates.emplace_back();
    std::copy_n(signature.data(), out.size(), out.data());
  }
  return candidates;
}

std::optional<std::vector<uint8_t>> der_encode(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!r || !s) {
    return std::nullopt;
  }
  if (ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

bool verify_secp256k1(
    const custodia::schema::bytes_view_t& message,
    const custodia::schema::secp256k1_signer_id& signer,
    const custodia::schema::secp256k1_signature_t& signature) {
  auto candidates = compact_secp256k1_candidates(signature);
  if (candidates.empty()) {
    return false;
  }
  auto pkey = make_secp256k1_public_key(signer);
  if (!pkey) {
    return false;
  }
  return std::any_of(
      std::begin(candidates), std::end(candidates),
      [&](const std::array<uint8_t, 64>& compact) {
        auto der = der_encode(compact);
        return der.has_value() &&
               digest_verify(pkey.get(), EVP_sha256(), der->data(),
                             der->size(), message);
      });
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return static_cast<bool>(ed25519) && static_cast<bool>(ec);
  }();
  return available_now;
}

bool verify_signature(const custodia::schema::bytes_view_t& message,
                      const custodia::schema::signer_id_t& signer,
                      const custodia::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const custodia::schema::ed25519_signer_id& key) {
            const auto* value =
                std::get_if<custodia::schema::ed25519_signature_t>(&signature);
            return value != nullptr && verify_ed25519(message, key, *value);
          },
          [&](const custodia::schema::secp256k1_signer_id& key) {
            const auto* value =
                std::get_if<custodia::schema::secp256k1_signature_t>(
                    &signature);
            return value != nullptr && verify_secp256k1(message, key, *value);
          }},
      signer);
}

custodia::schema::account_id_t account_from_signer(
    const custodia::schema::signer_id_t& signer) {
  auto material = custodia::schema::bytes_t{};
  std::visit(overloaded{[&](const custodia::schema::ed25519_signer_id& key) {
                          material.push_back(kEd25519Tag);
                          material.insert(std::end(material),
                                          std::begin(key.public_key),
                                          std::end(key.public_key));
                        },
                        [&](const custodia::schema::secp256k1_signer_id& key) {
                          material.push_back(kSecp256k1Tag);
                          material.insert(std::end(material),
                                          std::begin(key.public_key),
                                          std::end(key.public_key));
                        }},
             signer);
  return custodia::blake3::hash(
      custodia::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<custodia::schema::account_id_t> recover_signer(
    const custodia::schema::bytes_view_t& digest,
    const custodia::schema::signature_envelope_t& envelope) {
  if (!verify_signature(digest, envelope.signer, envelope.signature)) {
    return std::nullopt;
  }
  return account_from_signer(envelope.signer);
}

}  // namespace custodia::crypto
