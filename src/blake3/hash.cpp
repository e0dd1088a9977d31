#include <blake3.h>
#include <custodia/blake3/hash.hpp>

namespace custodia::blake3 {

namespace {

custodia::schema::hash32_t digest(const void* data, const std::size_t size) {
  static_assert(BLAKE3_OUT_LEN ==
                std::tuple_size_v<custodia::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = custodia::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

custodia::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

custodia::schema::hash32_t hash(const custodia::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace custodia::blake3
