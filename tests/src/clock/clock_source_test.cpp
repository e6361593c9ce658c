#include <gtest/gtest.h>
#include <remit/clock/clock_source.hpp>

#include <chrono>
#include <set>

TEST(clock_source, hour_of_day_tolerates_height_zero) {
  EXPECT_EQ(remit::clock::hour_of_day(0), 0u);
}

TEST(clock_source, hour_of_day_advances_every_144_blocks) {
  EXPECT_EQ(remit::clock::hour_of_day(143), 0u);
  EXPECT_EQ(remit::clock::hour_of_day(144), 1u);
  EXPECT_EQ(remit::clock::hour_of_day(9 * 144), 9u);
  EXPECT_EQ(remit::clock::hour_of_day(17 * 144 + 143), 17u);
}

TEST(clock_source, hour_of_day_wraps_after_a_day) {
  EXPECT_EQ(remit::clock::hour_of_day(24 * 144), 0u);
  EXPECT_EQ(remit::clock::hour_of_day(24 * 144 + 10 * 144), 10u);
}

TEST(clock_source, hour_of_day_honors_custom_block_rate) {
  EXPECT_EQ(remit::clock::hour_of_day(30, 6), 5u);
  EXPECT_EQ(remit::clock::hour_of_day(6 * 24, 6), 0u);
}

TEST(clock_source, manual_height_never_moves_backwards) {
  auto clock = remit::clock::manual_height_source{100};
  EXPECT_EQ(clock.current_height(), 100u);
  EXPECT_TRUE(clock.set_height(150));
  EXPECT_FALSE(clock.set_height(120));
  EXPECT_EQ(clock.current_height(), 150u);
  clock.advance(5);
  EXPECT_EQ(clock.current_height(), 155u);
}

TEST(clock_source, wall_clock_height_is_positive_and_monotonic) {
  auto clock = remit::clock::wall_clock_height_source{};
  auto first = clock.current_height();
  auto second = clock.current_height();
  EXPECT_GT(first, 0u);
  EXPECT_GE(second, first);
}

TEST(clock_source, wall_clock_hour_matches_utc_hour) {
  auto clock = remit::clock::wall_clock_height_source{};
  // Day 20000 after the epoch, 07:00 and 07:59:59 UTC.
  auto seven = std::chrono::system_clock::time_point{
      std::chrono::hours{20'000 * 24 + 7}};
  EXPECT_EQ(remit::clock::hour_of_day(clock.height_at(seven)), 7u);
  EXPECT_EQ(remit::clock::hour_of_day(clock.height_at(
                seven + std::chrono::minutes{59} + std::chrono::seconds{59})),
            7u);
  EXPECT_EQ(remit::clock::hour_of_day(
                clock.height_at(seven + std::chrono::hours{17})),
            0u);
}

TEST(clock_source, one_real_hour_advances_hour_of_day_by_one) {
  for (uint64_t blocks_per_hour : {uint64_t{144}, uint64_t{7}, uint64_t{1}}) {
    auto clock = remit::clock::wall_clock_height_source{blocks_per_hour};
    auto time = std::chrono::system_clock::time_point{
        std::chrono::hours{500'000} + std::chrono::minutes{17} +
        std::chrono::seconds{3}};
    auto hours_seen = std::set<uint64_t>{};
    for (auto step = 0; step < 24; ++step) {
      auto hour =
          remit::clock::hour_of_day(clock.height_at(time), blocks_per_hour);
      auto next = remit::clock::hour_of_day(
          clock.height_at(time + std::chrono::hours{1}), blocks_per_hour);
      EXPECT_EQ(next, (hour + 1) % 24) << "blocks_per_hour=" << blocks_per_hour;
      hours_seen.insert(hour);
      time += std::chrono::hours{1};
    }
    EXPECT_EQ(hours_seen.size(), 24u);
  }
}

TEST(clock_source, wall_clock_advances_blocks_per_hour_each_hour) {
  auto clock = remit::clock::wall_clock_height_source{};
  auto time = std::chrono::system_clock::time_point{std::chrono::hours{1'000}};
  EXPECT_EQ(clock.height_at(time + std::chrono::hours{1}) -
                clock.height_at(time),
            144u);
  EXPECT_EQ(clock.height_at(time + std::chrono::seconds{25}) -
                clock.height_at(time),
            1u);
}
