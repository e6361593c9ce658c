#pragma once

#include <remit/clock/clock_source.hpp>
#include <remit/schema/operation_result.hpp>

#include <cstdint>

namespace remit::execution {

/// Tunables for batch gating. Defaults match the production deployment.
struct engine_config final {
  uint64_t blocks_per_hour{remit::clock::kDefaultBlocksPerHour};
  uint64_t start_hour{9};
  uint64_t end_hour{17};
  // 50,000 whole units expressed in micro-units.
  uint64_t high_value_threshold{50'000'000'000};
  uint64_t balance_buffer_percent{110};
  uint64_t max_instructions{50};
  uint64_t max_signatures{10};
  bool enforce_performance_gate{false};
};

/// Reject configurations the evaluator cannot honor.
///
/// Fails with `invalid_threshold` when `blocks_per_hour` is zero, an hour is
/// outside [0, 23], the window is inverted, or the buffer is below 100%.
remit::schema::operation_result_t validate_config(const engine_config& config);

}  // namespace remit::execution
