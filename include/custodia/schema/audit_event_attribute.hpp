#pragma once

#include <cstdint>
#include <string>

// Schema type: audit event attribute.
// Escrow workflow: key/value pair attached to an audit record for off-chain
// reconciliation.
namespace custodia::schema {

template <uint16_t Version>
struct audit_event_attribute;

template <>
struct audit_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
};

using audit_event_attribute_t = audit_event_attribute<1>;

}  // namespace custodia::schema
