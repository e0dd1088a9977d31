#pragma once
#include <custodia/schema/primitives.hpp>

// Schema type: submit documentation.
// Escrow workflow: Reference to supporting documents, by content hash. Audit
// only.
namespace custodia::schema {

template <uint16_t Version>
struct submit_documentation;

template <>
struct submit_documentation<1> final {
  uint16_t version{1};
  allocation_id_t allocation_id{};
  hash32_t document_hash{};
  block_height_t timestamp{};
};

using submit_documentation_t = submit_documentation<1>;

}  // namespace custodia::schema
