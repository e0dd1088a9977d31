#pragma once

#include <custodia/schema/primitives.hpp>
#include <cstdint>

// Schema type: engine options.
// Escrow workflow: deployment-time configuration of a registry instance.
namespace custodia::schema {

template <uint16_t Version>
struct engine_options;

template <>
struct engine_options<1> final {
  uint16_t version{1};
  /// Privileged account with override authority (freeze, revert, arbitrate).
  account_id_t supervisor{};
  /// Domain separator mixed into every signed operation digest.
  hash32_t registry_id{};
  /// Maximum age, in blocks, of a timestamp accepted as recent.
  block_height_t recent_window{144};
  block_height_t max_duration{5'256'000};
  block_height_t max_hold_duration{52'560};
  block_height_t max_rate_limit_window{52'560};
  uint32_t max_multisig_signers{10};
  uint32_t max_rate_limit_operations{1000};
  uint32_t max_priority{10};
};

using engine_options_t = engine_options<1>;

}  // namespace custodia::schema
