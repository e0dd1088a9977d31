#include <gtest/gtest.h>
#include <custodia/schema/allocation_status.hpp>
#include <custodia/schema/error_code.hpp>
#include <custodia/schema/operation_type.hpp>
#include <custodia/schema/role_id.hpp>

#include <cstddef>

using custodia::schema::allocation_status_t;
using custodia::schema::error_code_t;
using custodia::schema::error_kind_t;

TEST(allocation_status, names_fit_ten_characters_and_round_trip) {
  for (const auto& [name, value] :
       custodia::schema::kAllocationStatusMappings) {
    EXPECT_LE(name.size(), 10u) << name;
    EXPECT_EQ(custodia::schema::to_string(value), name);
    auto parsed =
        custodia::schema::try_from_string<allocation_status_t>(name);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, value);
  }
  EXPECT_FALSE(custodia::schema::try_from_string<allocation_status_t>("gone")
                   .has_value());
}

TEST(allocation_status, exactly_six_statuses_are_terminal) {
  auto terminal = std::size_t{};
  for (const auto& [name, value] :
       custodia::schema::kAllocationStatusMappings) {
    if (custodia::schema::is_terminal(value)) {
      ++terminal;
    }
  }
  EXPECT_EQ(terminal, 6u);
  EXPECT_TRUE(custodia::schema::is_terminal(allocation_status_t::retrieved));
  EXPECT_FALSE(custodia::schema::is_terminal(allocation_status_t::frozen));
  EXPECT_FALSE(custodia::schema::is_terminal(allocation_status_t::accepted));
}

TEST(operation_type, names_round_trip) {
  for (const auto& [name, value] : custodia::schema::kOperationTypeMappings) {
    auto parsed =
        custodia::schema::try_from_string<custodia::schema::operation_type_t>(
            name);
    ASSERT_TRUE(parsed.has_value()) << name;
    EXPECT_EQ(*parsed, value);
  }
}

TEST(role_id, names_round_trip) {
  auto parsed =
      custodia::schema::try_from_string<custodia::schema::role_id_t>(
          "beneficiary");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, custodia::schema::role_id_t::beneficiary);
  EXPECT_EQ(custodia::schema::to_string(custodia::schema::role_id_t::supervisor),
            "supervisor");
}

TEST(error_code, every_code_maps_to_one_kind) {
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::ok), error_kind_t::none);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::unauthorized),
            error_kind_t::unauthorized);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::allocation_missing),
            error_kind_t::not_found);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::not_active),
            error_kind_t::already_processed);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::not_challenged),
            error_kind_t::already_processed);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::lapsed),
            error_kind_t::lapsed);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::invalid_percentage),
            error_kind_t::invalid_quantity);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::custodian_as_party),
            error_kind_t::invalid_party);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::signer_mismatch),
            error_kind_t::verification_failed);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::movement_failed),
            error_kind_t::movement_failed);
  EXPECT_EQ(custodia::schema::kind_of(error_code_t::invalid_identifier),
            error_kind_t::invalid_identifier);
}

TEST(error_code, messages_are_distinct_from_unknown) {
  EXPECT_NE(custodia::schema::to_string(error_code_t::not_lapsed), "unknown");
  EXPECT_NE(custodia::schema::to_string(error_code_t::dust_release),
            custodia::schema::to_string(error_code_t::invalid_quantity));
}
