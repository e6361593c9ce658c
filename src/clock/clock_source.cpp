#include <remit/clock/clock_source.hpp>
#include <remit/common/critical.hpp>

#include <spdlog/spdlog.h>

namespace remit::clock {

namespace {

constexpr uint64_t kMillisecondsPerHour = 3'600'000;

}  // namespace

manual_height_source::manual_height_source(
    remit::schema::block_height_t height)
    : height_{height} {}

remit::schema::block_height_t manual_height_source::current_height() const {
  return height_;
}

bool manual_height_source::set_height(remit::schema::block_height_t height) {
  if (height < height_) {
    spdlog::warn("Ignoring height {} below current height {}", height,
                 height_);
    return false;
  }
  height_ = height;
  return true;
}

void manual_height_source::advance(remit::schema::block_height_t blocks) {
  height_ += blocks;
}

wall_clock_height_source::wall_clock_height_source(uint64_t blocks_per_hour)
    : blocks_per_hour_{blocks_per_hour} {
  if (blocks_per_hour_ == 0) {
    remit::common::critical("blocks per hour must be positive");
  }
}

remit::schema::block_height_t wall_clock_height_source::current_height()
    const {
  return height_at(std::chrono::system_clock::now());
}

remit::schema::block_height_t wall_clock_height_source::height_at(
    std::chrono::system_clock::time_point time) const {
  auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
                         time.time_since_epoch())
                         .count();
  if (since_epoch < 0) {
    return 0;
  }
  // floor(ms * bph / ms_per_hour) / bph == floor(ms / ms_per_hour).
  auto height = remit::schema::amount_t{static_cast<uint64_t>(since_epoch)};
  height *= blocks_per_hour_;
  height /= kMillisecondsPerHour;
  return height.convert_to<remit::schema::block_height_t>();
}

}  // namespace remit::clock
