#include <remit/execution/conditions.hpp>

#include <algorithm>

using namespace remit::schema;

namespace remit::execution {

namespace {

constexpr std::size_t index_of(condition_t condition) {
  return static_cast<std::size_t>(condition);
}

}  // namespace

bool condition_results::met(condition_t condition) const {
  return values[index_of(condition)];
}

bool condition_results::all_met() const {
  return std::all_of(std::begin(values), std::end(values),
                     [](bool value) { return value; });
}

std::optional<error_code> condition_results::first_failure(
    bool include_performance_gate) const {
  if (!met(condition_t::business_hours)) {
    return error_code::invalid_time;
  }
  if (!met(condition_t::high_value_authorization)) {
    return error_code::unauthorized;
  }
  if (!met(condition_t::balance_sufficiency)) {
    return error_code::insufficient_balance;
  }
  if (include_performance_gate && !met(condition_t::performance_gate)) {
    return error_code::performance_gate_closed;
  }
  return std::nullopt;
}

bool within_business_hours(block_height_t height, const engine_config& config) {
  auto hour = remit::clock::hour_of_day(height, config.blocks_per_hour);
  return hour >= config.start_hour && hour <= config.end_hour;
}

amount_t required_balance(uint64_t total_amount, const engine_config& config) {
  return amount_t{total_amount} * config.balance_buffer_percent / 100;
}

condition_results evaluate_conditions(const condition_inputs& inputs,
                                      const engine_config& config) {
  auto results = condition_results{};

  results.values[index_of(condition_t::business_hours)] =
      within_business_hours(inputs.current_height, config);

  // Strictly above the threshold takes the high value path, which needs an
  // authorized caller and at least two signatures.
  auto high_value = inputs.total_amount > config.high_value_threshold;
  results.values[index_of(condition_t::high_value_authorization)] =
      !high_value ||
      (inputs.caller_is_authorized_signer && inputs.signature_count > 1);

  results.values[index_of(condition_t::balance_sufficiency)] =
      amount_t{inputs.available_balance} >=
      required_balance(inputs.total_amount, config);

  results.values[index_of(condition_t::performance_gate)] =
      inputs.performance_metric > 0;

  return results;
}

}  // namespace remit::execution
