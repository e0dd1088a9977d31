#pragma once

#include <custodia/schema/audit_event_attribute.hpp>
#include <custodia/schema/operation_type.hpp>
#include <custodia/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: audit event.
// Escrow workflow: one record per successful operation, emitted after the store
// commit. Sequence numbers are gap-free per engine instance.
namespace custodia::schema {

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  block_height_t height{};
  operation_type_t type{};
  allocation_id_t allocation_id{};
  account_id_t caller{};
  std::vector<audit_event_attribute_t> attributes;
};

using audit_event_t = audit_event<1>;

}  // namespace custodia::schema
