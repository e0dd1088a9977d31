#pragma once
#include <custodia/schema/primitives.hpp>
#include <span>

namespace custodia::schema::encoding {

/// Canonical byte encoding, selected at build time by library tag.
///
/// The registry only needs encoding for digest material, so there is a
/// single specialization; the tag keeps call sites independent of the
/// codec library.
template <typename Library>
struct encoder {
  template <typename T>
  custodia::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, custodia::schema::bytes_t& out);
};

}  // namespace custodia::schema::encoding
