#pragma once
#include <custodia/schema/primitives.hpp>
#include <vector>

// Schema type: register multisig.
// Escrow workflow: Declares the signer set and threshold used for off-chain
// coordination. Audit only.
namespace custodia::schema {

template <uint16_t Version>
struct register_multisig;

template <>
struct register_multisig<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  std::vector<account_id_t> signers;
  uint32_t threshold{};
};

using register_multisig_t = register_multisig<1>;

}  // namespace custodia::schema
