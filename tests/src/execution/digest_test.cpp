#include <custodia/execution/digest.hpp>
#include <custodia/testing/common.hpp>
#include <gtest/gtest.h>

using custodia::schema::operation_type_t;
using custodia::testing::make_hash;

namespace {

custodia::schema::hash32_t digest(
    const custodia::schema::hash32_t& registry,
    const operation_type_t operation,
    const custodia::schema::allocation_id_t id,
    const custodia::schema::hash32_t& subject,
    const custodia::schema::block_height_t timestamp) {
  auto encoder = custodia::schema::encoding::scale_encoder_t{};
  return custodia::execution::make_operation_digest(encoder, registry,
                                                    operation, id, subject,
                                                    timestamp);
}

}  // namespace

TEST(operation_digest, is_deterministic) {
  EXPECT_EQ(digest(make_hash(1), operation_type_t::verify_two_factor, 3,
                   make_hash(2), 40),
            digest(make_hash(1), operation_type_t::verify_two_factor, 3,
                   make_hash(2), 40));
}

TEST(operation_digest, binds_every_field) {
  const auto base = digest(make_hash(1), operation_type_t::verify_two_factor,
                           3, make_hash(2), 40);
  EXPECT_NE(base, digest(make_hash(9), operation_type_t::verify_two_factor, 3,
                         make_hash(2), 40));
  EXPECT_NE(base, digest(make_hash(1), operation_type_t::approve_multisig, 3,
                         make_hash(2), 40));
  EXPECT_NE(base, digest(make_hash(1), operation_type_t::verify_two_factor, 4,
                         make_hash(2), 40));
  EXPECT_NE(base, digest(make_hash(1), operation_type_t::verify_two_factor, 3,
                         make_hash(3), 40));
  EXPECT_NE(base, digest(make_hash(1), operation_type_t::verify_two_factor, 3,
                         make_hash(2), 41));
  EXPECT_FALSE(custodia::schema::is_zero_hash(base));
}
