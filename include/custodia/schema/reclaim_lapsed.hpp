#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: reclaim lapsed.
// Escrow workflow: Refund of an active allocation whose termination block has
// passed.
namespace custodia::schema {

template <uint16_t Version>
struct reclaim_lapsed;

template <>
struct reclaim_lapsed<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
};

using reclaim_lapsed_t = reclaim_lapsed<1>;

}  // namespace custodia::schema
