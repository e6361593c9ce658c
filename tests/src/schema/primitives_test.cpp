#include <gtest/gtest.h>
#include <remit/schema/condition.hpp>
#include <remit/schema/error_code.hpp>
#include <remit/schema/operation_result.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transfer_status.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = remit::schema::bytes_t(32, 0xAB);
  auto hash = remit::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = remit::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_bad_input) {
  EXPECT_FALSE(remit::schema::try_make_hash32(std::string_view{"abc"}));
  EXPECT_FALSE(remit::schema::try_make_hash32(std::string_view{
      "zz02030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20"}));
}

TEST(primitives, to_hex_matches_make_hash32) {
  auto hex = std::string{
      "00ff030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20"};
  auto hash = remit::schema::make_hash32(std::string_view{hex});
  EXPECT_EQ(remit::schema::to_hex(
                remit::schema::bytes_view_t{hash.data(), hash.size()}),
            hex);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = remit::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, error_codes_have_stable_names) {
  using remit::schema::error_code;
  EXPECT_EQ(remit::schema::to_string(error_code::unauthorized),
            "unauthorized");
  EXPECT_EQ(remit::schema::to_string(error_code::invalid_time),
            "invalid_time");
  EXPECT_EQ(static_cast<uint32_t>(error_code::transfer_failed), 4u);
  EXPECT_EQ(remit::schema::try_from_string<error_code>("insufficient_balance"),
            error_code::insufficient_balance);
  EXPECT_FALSE(remit::schema::try_from_string<error_code>("nope").has_value());
}

TEST(primitives, condition_positions_follow_evaluation_order) {
  using remit::schema::condition_t;
  EXPECT_EQ(static_cast<int>(condition_t::business_hours), 0);
  EXPECT_EQ(static_cast<int>(condition_t::performance_gate), 3);
  EXPECT_EQ(remit::schema::to_string(condition_t::balance_sufficiency),
            "balance_sufficiency");
  EXPECT_EQ(remit::schema::to_string(
                remit::schema::transfer_status::insufficient_funds),
            "insufficient_funds");
}

TEST(primitives, error_result_carries_code_and_name) {
  auto result = remit::schema::make_error_result(
      remit::schema::error_code::invalid_batch, "too many", "remit.test");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code, 6u);
  EXPECT_EQ(result.log, "invalid_batch");
  EXPECT_EQ(result.info, "too many");
  EXPECT_EQ(result.codespace, "remit.test");
  EXPECT_TRUE(remit::schema::operation_result_t{}.ok());
}

TEST(primitives, try_make_hash32_requires_64_hex_digits) {
  // 32 hex digits is a 16 byte value, not a raw 32 byte principal.
  EXPECT_FALSE(remit::schema::try_make_hash32(
      std::string_view{"0123456789abcdef0123456789abcdef"}));
  EXPECT_FALSE(remit::schema::try_make_hash32(
      std::string_view{"alice-the-treasurer-of-the-bank!"}));
  EXPECT_FALSE(remit::schema::try_make_hash32(std::string_view{
      "0x0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"}));
  EXPECT_FALSE(remit::schema::try_make_hash32(std::string_view{
      "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f2021"}));
  EXPECT_TRUE(remit::schema::try_make_hash32(std::string_view{
      "0X0102030405060708090A0B0C0D0E0F101112131415161718191A1B1C1D1E1F20"}));
}
