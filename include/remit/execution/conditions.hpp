#pragma once

#include <remit/execution/engine_config.hpp>
#include <remit/schema/condition.hpp>
#include <remit/schema/error_code.hpp>
#include <remit/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace remit::execution {

/// Everything the evaluator looks at for one batch.
struct condition_inputs final {
  remit::schema::block_height_t current_height{};
  uint64_t total_amount{};
  uint64_t available_balance{};
  bool caller_is_authorized_signer{};
  uint64_t signature_count{};
  uint64_t performance_metric{};
};

struct condition_results final {
  remit::schema::conditions_met_t values{};

  bool met(remit::schema::condition_t condition) const;
  bool all_met() const;

  /// First failing gate among business hours, high value authorization and
  /// balance sufficiency, in that order, mapped to its error. The
  /// performance gate is only considered when `include_performance_gate`.
  std::optional<remit::schema::error_code> first_failure(
      bool include_performance_gate = false) const;
};

bool within_business_hours(remit::schema::block_height_t height,
                           const engine_config& config);

/// Minimum balance for `total_amount`: total * buffer / 100, truncated.
remit::schema::amount_t required_balance(uint64_t total_amount,
                                         const engine_config& config);

/// Evaluate all four conditions. Pure; never short-circuits.
condition_results evaluate_conditions(const condition_inputs& inputs,
                                      const engine_config& config);

}  // namespace remit::execution
