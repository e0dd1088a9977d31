#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: establish timelock.
// Escrow workflow: Locks a pending allocation until its termination block; the
// beneficiary retrieves it afterwards.
namespace custodia::schema {

template <uint16_t Version>
struct establish_timelock;

template <>
struct establish_timelock<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  block_height_t unlock_height{};
};

using establish_timelock_t = establish_timelock<1>;

}  // namespace custodia::schema
