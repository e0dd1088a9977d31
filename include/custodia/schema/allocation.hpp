#pragma once
#include <custodia/schema/allocation_status.hpp>
#include <custodia/schema/primitives.hpp>

namespace custodia::schema {

template <uint16_t Version>
struct allocation;

template <>
struct allocation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  account_id_t originator{};
  account_id_t beneficiary{};
  resource_id_t resource_id{};
  amount_t quantity{};
  allocation_status_t status{allocation_status_t::pending};
  block_height_t genesis_block{};
  block_height_t termination_block{};

  bool operator==(const allocation&) const = default;
};

using allocation_t = allocation<1>;

}  // namespace custodia::schema
