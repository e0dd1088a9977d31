#pragma once
#include <custodia/common/critical.hpp>
#include <custodia/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace custodia::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  custodia::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, custodia::schema::bytes_t& out);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
custodia::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    custodia::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        custodia::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

}  // namespace custodia::schema::encoding
