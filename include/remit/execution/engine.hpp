#pragma once

#include <remit/authorization/registry.hpp>
#include <remit/clock/clock_source.hpp>
#include <remit/execution/engine_config.hpp>
#include <remit/execution/transfer_service.hpp>
#include <remit/ledger/audit_ledger.hpp>
#include <remit/schema/batch_record.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/engine_state.hpp>
#include <remit/schema/operation_result.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transfer_instruction.hpp>
#include <remit/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace remit::execution {

/// Batch transfer orchestrator.
///
/// Gates a batch on business hours, high value authorization and balance
/// sufficiency, applies its transfers through the transfer service, and
/// records the outcome in the audit ledger. Gating failures leave no trace;
/// once transfers start, exactly one record is written whatever the outcome.
/// Every public operation is serialized on one mutex.
class engine final {
 public:
  using encoder_t = remit::schema::encoding::encoder<
      remit::schema::encoding::scale_encoder_tag>;
  using storage_t =
      remit::storage::storage<remit::storage::rocksdb_storage_tag>;

  /// Construct the engine over persisted state.
  ///
  /// `bootstrap_owner` is used only when storage holds no owner yet. An
  /// invalid `config` is fatal.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  transfer_service& transfers,
                  const remit::clock::height_source& clock,
                  const remit::schema::principal_t& bootstrap_owner,
                  engine_config config = {});

  remit::schema::operation_result_t set_contract_owner(
      const remit::schema::principal_t& caller,
      const remit::schema::principal_t& new_owner);

  remit::schema::operation_result_t add_authorized_signer(
      const remit::schema::principal_t& caller,
      const remit::schema::principal_t& signer);

  remit::schema::operation_result_t remove_authorized_signer(
      const remit::schema::principal_t& caller,
      const remit::schema::principal_t& signer);

  /// Owner-only. The metric feeds the performance gate condition.
  remit::schema::operation_result_t set_performance_metrics(
      const remit::schema::principal_t& caller,
      uint64_t value);

  /// Gate, apply and record one batch on behalf of `caller`.
  ///
  /// Returns `invalid_batch`, `invalid_time`, `unauthorized`,
  /// `insufficient_balance` (and `performance_gate_closed` when enforced)
  /// without writing anything. Returns `transfer_failed` after recording a
  /// failed batch.
  remit::schema::operation_result_t execute_batch_transfer(
      const remit::schema::principal_t& caller,
      const std::vector<remit::schema::transfer_instruction_t>& instructions,
      const std::vector<remit::schema::principal_t>& signatures);

  std::optional<remit::schema::batch_record_t> get_transfer_record(
      uint64_t id) const;

  /// Records with ids in [from_id, to_id], ascending.
  std::vector<remit::schema::batch_record_t> transfer_records(
      uint64_t from_id,
      uint64_t to_id) const;

  /// Timestamp of the latest successful batch, 0 before the first one.
  remit::schema::block_height_t get_last_execution() const;

  remit::schema::principal_t owner() const;
  bool is_authorized_signer(const remit::schema::principal_t& identity) const;
  std::vector<remit::schema::principal_t> authorized_signers() const;
  uint64_t performance_metric() const;
  uint64_t next_batch_id() const;
  remit::schema::hash32_t ledger_digest() const;
  const engine_config& config() const;

 private:
  /// Sum of all amounts, or std::nullopt when it does not fit in 64 bits.
  static std::optional<uint64_t> total_amount(
      const std::vector<remit::schema::transfer_instruction_t>& instructions);

  remit::schema::operation_result_t validate_shape(
      const std::vector<remit::schema::transfer_instruction_t>& instructions,
      const std::vector<remit::schema::principal_t>& signatures) const;

  remit::storage::key_value_entry_t make_state_row(
      const remit::schema::engine_state_t& state);

  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  transfer_service& transfers_;
  const remit::clock::height_source& clock_;
  engine_config config_;
  remit::authorization::registry registry_;
  remit::ledger::audit_ledger ledger_;
  remit::schema::engine_state_t state_;
};

}  // namespace remit::execution
