#include <remit/execution/engine_config.hpp>

#include <string>
#include <string_view>
#include <utility>

using namespace remit::schema;

namespace {

constexpr auto kConfigCodespace = std::string_view{"remit.config"};

}  // namespace

namespace remit::execution {

operation_result_t validate_config(const engine_config& config) {
  auto reject = [](std::string info) {
    return make_error_result(error_code::invalid_threshold, std::move(info),
                             std::string{kConfigCodespace});
  };
  if (config.blocks_per_hour == 0) {
    return reject("blocks_per_hour must be positive");
  }
  if (config.start_hour >= remit::clock::kHoursPerDay ||
      config.end_hour >= remit::clock::kHoursPerDay) {
    return reject("business hours must be within [0, 23]");
  }
  if (config.start_hour > config.end_hour) {
    return reject("start_hour must not exceed end_hour");
  }
  if (config.balance_buffer_percent < 100) {
    return reject("balance_buffer_percent must be at least 100");
  }
  return {};
}

}  // namespace remit::execution
