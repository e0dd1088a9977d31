#include <custodia/blake3/hash.hpp>
#include <custodia/execution/digest.hpp>
#include <string_view>
#include <tuple>

namespace custodia::execution {

namespace {

constexpr auto kDigestDomain = std::string_view{"custodia.operation.v1"};

}  // namespace

custodia::schema::hash32_t make_operation_digest(
    custodia::schema::encoding::scale_encoder_t& encoder,
    const custodia::schema::hash32_t& registry_id,
    const custodia::schema::operation_type_t operation,
    const custodia::schema::allocation_id_t allocation_id,
    const custodia::schema::hash32_t& subject,
    const custodia::schema::block_height_t timestamp) {
  auto material = custodia::schema::make_bytes(kDigestDomain);
  encoder.encode(std::tuple{registry_id, static_cast<uint8_t>(operation),
                            allocation_id, subject, timestamp},
                 material);
  return custodia::blake3::hash(
      custodia::schema::bytes_view_t{material.data(), material.size()});
}

}  // namespace custodia::execution
