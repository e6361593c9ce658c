#include <remit/execution/conditions.hpp>
#include <remit/execution/engine.hpp>
#include <remit/execution/transfer_applier.hpp>
#include <remit/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace remit::schema;

namespace {

constexpr auto kAdminCodespace = std::string_view{"remit.admin"};
constexpr auto kExecuteCodespace = std::string_view{"remit.execute"};

std::string principal_hex(const principal_t& principal) {
  return to_hex(bytes_view_t{principal.data(), principal.size()});
}

uint64_t distinct_signature_count(const std::vector<principal_t>& signatures) {
  auto distinct = std::set<principal_t>{std::begin(signatures),
                                        std::end(signatures)};
  return distinct.size();
}

std::string describe_rejection(const error_code code,
                               const remit::execution::condition_inputs& inputs,
                               const remit::execution::engine_config& config) {
  switch (code) {
    case error_code::invalid_time:
      return "hour " +
             std::to_string(remit::clock::hour_of_day(
                 inputs.current_height, config.blocks_per_hour)) +
             " is outside [" + std::to_string(config.start_hour) + ", " +
             std::to_string(config.end_hour) + "]";
    case error_code::unauthorized:
      return "high value batch needs an authorized caller and more than one "
             "signature";
    case error_code::insufficient_balance:
      return "balance " + std::to_string(inputs.available_balance) +
             " is below required " +
             remit::execution::required_balance(inputs.total_amount, config)
                 .str();
    case error_code::performance_gate_closed:
      return "performance metric is zero";
    default:
      return std::string{to_string(code)};
  }
}

}  // namespace

namespace remit::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               transfer_service& transfers,
               const remit::clock::height_source& clock,
               const principal_t& bootstrap_owner,
               engine_config config)
    : encoder_{encoder},
      storage_{storage},
      transfers_{transfers},
      clock_{clock},
      config_{config},
      registry_{encoder, storage, bootstrap_owner},
      ledger_{encoder, storage} {
  auto lock = std::scoped_lock{mutex_};
  auto validated = validate_config(config_);
  if (!validated.ok()) {
    spdlog::error("Invalid engine configuration: {}", validated.info);
    remit::common::critical("invalid engine configuration");
  }
  if (config_.enforce_performance_gate) {
    spdlog::warn("Performance gate enforcement enabled");
  }
  load_persisted_state();
  spdlog::info("Batch engine ready: next batch {}, last execution {}",
               state_.next_batch_id, ledger_.last_execution());
}

operation_result_t engine::set_contract_owner(const principal_t& caller,
                                              const principal_t& new_owner) {
  auto lock = std::scoped_lock{mutex_};
  return registry_.set_owner(caller, new_owner);
}

operation_result_t engine::add_authorized_signer(const principal_t& caller,
                                                 const principal_t& signer) {
  auto lock = std::scoped_lock{mutex_};
  return registry_.add_signer(caller, signer);
}

operation_result_t engine::remove_authorized_signer(const principal_t& caller,
                                                    const principal_t& signer) {
  auto lock = std::scoped_lock{mutex_};
  return registry_.remove_signer(caller, signer);
}

operation_result_t engine::set_performance_metrics(const principal_t& caller,
                                                   uint64_t value) {
  auto lock = std::scoped_lock{mutex_};
  if (!registry_.is_owner(caller)) {
    spdlog::warn("Rejected set_performance_metrics from non-owner {}",
                 principal_hex(caller));
    return make_error_result(error_code::unauthorized,
                             "set_performance_metrics requires the owner",
                             std::string{kAdminCodespace});
  }
  auto next_state = state_;
  next_state.performance_metric = value;
  auto row = make_state_row(next_state);
  storage_.write_batch({row}, {});
  state_ = next_state;
  spdlog::info("Performance metric set to {}", value);
  return {};
}

operation_result_t engine::execute_batch_transfer(
    const principal_t& caller,
    const std::vector<transfer_instruction_t>& instructions,
    const std::vector<principal_t>& signatures) {
  auto lock = std::scoped_lock{mutex_};

  auto shape = validate_shape(instructions, signatures);
  if (!shape.ok()) {
    spdlog::warn("Rejected batch from {}: {}", principal_hex(caller),
                 shape.info);
    return shape;
  }
  auto total = total_amount(instructions);
  if (!total) {
    spdlog::warn("Rejected batch from {}: total amount overflows",
                 principal_hex(caller));
    return make_error_result(error_code::invalid_batch,
                             "total amount does not fit in 64 bits",
                             std::string{kExecuteCodespace});
  }

  auto inputs = condition_inputs{
      .current_height = clock_.current_height(),
      .total_amount = *total,
      .available_balance = transfers_.balance_of(caller),
      .caller_is_authorized_signer = registry_.is_authorized(caller),
      .signature_count = distinct_signature_count(signatures),
      .performance_metric = state_.performance_metric};
  auto conditions = evaluate_conditions(inputs, config_);

  if (auto failure =
          conditions.first_failure(config_.enforce_performance_gate)) {
    auto info = describe_rejection(*failure, inputs, config_);
    spdlog::warn("Rejected batch from {} with {}: {}", principal_hex(caller),
                 to_string(*failure), info);
    return make_error_result(*failure, std::move(info),
                             std::string{kExecuteCodespace});
  }

  transfers_.begin_batch();
  auto applied = apply_transfers(transfers_, caller, instructions);
  auto rows = std::vector<remit::storage::key_value_entry_t>{};
  if (applied.success) {
    rows = transfers_.commit_batch_rows();
  } else {
    transfers_.abort_batch();
  }

  auto record = batch_record_t{.id = state_.next_batch_id,
                               .timestamp = inputs.current_height,
                               .total_amount = *total,
                               .success = applied.success,
                               .conditions_met = conditions.values};
  auto next_state = state_;
  ++next_state.next_batch_id;
  // Balances, engine state and the record land in one write.
  rows.push_back(make_state_row(next_state));
  ledger_.put(record, rows);
  state_ = next_state;

  if (!applied.success) {
    return make_error_result(
        error_code::transfer_failed,
        "batch " + std::to_string(record.id) + " failed at instruction " +
            std::to_string(applied.failed_index.value_or(0)) + ": " +
            std::string{to_string(applied.status)},
        std::string{kExecuteCodespace});
  }

  spdlog::info("Batch {} applied {} transfer(s) totalling {} at height {}",
               record.id, applied.applied, record.total_amount,
               record.timestamp);
  auto result = operation_result_t{};
  result.info = "batch " + std::to_string(record.id) + " recorded";
  result.codespace = std::string{kExecuteCodespace};
  return result;
}

std::optional<batch_record_t> engine::get_transfer_record(uint64_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.get(id);
}

std::vector<batch_record_t> engine::transfer_records(uint64_t from_id,
                                                     uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.records(from_id, to_id);
}

block_height_t engine::get_last_execution() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.last_execution();
}

principal_t engine::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.owner();
}

bool engine::is_authorized_signer(const principal_t& identity) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.is_authorized(identity);
}

std::vector<principal_t> engine::authorized_signers() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.signers();
}

uint64_t engine::performance_metric() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.performance_metric;
}

uint64_t engine::next_batch_id() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.next_batch_id;
}

hash32_t engine::ledger_digest() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.digest();
}

const engine_config& engine::config() const {
  return config_;
}

std::optional<uint64_t> engine::total_amount(
    const std::vector<transfer_instruction_t>& instructions) {
  auto total = uint64_t{};
  for (const auto& instruction : instructions) {
    if (instruction.amount > std::numeric_limits<uint64_t>::max() - total) {
      return std::nullopt;
    }
    total += instruction.amount;
  }
  return total;
}

operation_result_t engine::validate_shape(
    const std::vector<transfer_instruction_t>& instructions,
    const std::vector<principal_t>& signatures) const {
  if (instructions.size() > config_.max_instructions) {
    return make_error_result(
        error_code::invalid_batch,
        std::to_string(instructions.size()) + " instructions exceed limit " +
            std::to_string(config_.max_instructions),
        std::string{kExecuteCodespace});
  }
  if (signatures.size() > config_.max_signatures) {
    return make_error_result(
        error_code::invalid_batch,
        std::to_string(signatures.size()) + " signatures exceed limit " +
            std::to_string(config_.max_signatures),
        std::string{kExecuteCodespace});
  }
  return {};
}

remit::storage::key_value_entry_t engine::make_state_row(
    const engine_state_t& state) {
  return {key::make_engine_state_key(), encoder_.encode(state)};
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto state_key = key::make_engine_state_key();
  if (auto persisted =
          storage_.get<engine_state_t>(encoder_, make_bytes_view(state_key))) {
    state_ = *persisted;
  }
}

}  // namespace remit::execution
