#pragma once

#include <custodia/schema/allocation_status.hpp>
#include <custodia/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: operation result.
// Escrow workflow: outcome of one engine call. `code` is 0 on success or an
// error_code_t value; the allocation fields echo the committed record.
namespace custodia::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<allocation_id_t> allocation_id;
  std::optional<allocation_status_t> status;
};

using operation_result_t = operation_result<1>;

}  // namespace custodia::schema
