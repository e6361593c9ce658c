#pragma once

#include <remit/schema/primitives.hpp>

#include <chrono>
#include <cstdint>

namespace remit::clock {

inline constexpr uint64_t kDefaultBlocksPerHour = 144;
inline constexpr uint64_t kHoursPerDay = 24;

/// Cyclical hour derived from a monotonic height.
///
/// `blocks_per_hour` must be non-zero; callers validate it through
/// `execution::validate_config`.
constexpr uint64_t hour_of_day(remit::schema::block_height_t height,
                               uint64_t blocks_per_hour = kDefaultBlocksPerHour) {
  return (height / blocks_per_hour) % kHoursPerDay;
}

/// Source of the monotonic height the engine stamps records with.
class height_source {
 public:
  virtual ~height_source() = default;
  virtual remit::schema::block_height_t current_height() const = 0;
};

/// Height set explicitly by the caller. Never moves backwards.
class manual_height_source final : public height_source {
 public:
  explicit manual_height_source(remit::schema::block_height_t height = 0);

  remit::schema::block_height_t current_height() const override;

  /// Move to `height`; returns false and keeps the current height when
  /// `height` is lower.
  bool set_height(remit::schema::block_height_t height);
  void advance(remit::schema::block_height_t blocks = 1);

 private:
  remit::schema::block_height_t height_{};
};

/// Height derived from the system clock at `blocks_per_hour` blocks per real
/// hour, so `hour_of_day` of the current height is the UTC hour.
class wall_clock_height_source final : public height_source {
 public:
  explicit wall_clock_height_source(
      uint64_t blocks_per_hour = kDefaultBlocksPerHour);

  remit::schema::block_height_t current_height() const override;

  remit::schema::block_height_t height_at(
      std::chrono::system_clock::time_point time) const;

 private:
  uint64_t blocks_per_hour_;
};

}  // namespace remit::clock
