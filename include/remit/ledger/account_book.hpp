#pragma once

#include <remit/execution/transfer_service.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transfer_status.hpp>
#include <remit/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <map>
#include <vector>

namespace remit::ledger {

/// Reference transfer service keeping balances in RocksDB.
///
/// Outside a batch every transfer is written immediately. Between
/// `begin_batch` and `commit_batch` transfers are staged in memory and land
/// in one atomic write, or are handed to the caller by `commit_batch_rows`.
/// `abort_batch` discards them, so a failed batch leaves no balance changes
/// behind.
class account_book final : public remit::execution::transfer_service {
 public:
  using encoder_t = remit::schema::encoding::encoder<
      remit::schema::encoding::scale_encoder_tag>;
  using storage_t =
      remit::storage::storage<remit::storage::rocksdb_storage_tag>;

  account_book(encoder_t& encoder, storage_t& storage);

  uint64_t balance_of(const remit::schema::principal_t& account) const override;

  remit::schema::transfer_status transfer(
      uint64_t amount,
      const remit::schema::principal_t& from,
      const remit::schema::principal_t& to) override;

  void begin_batch() override;
  void commit_batch() override;
  void abort_batch() override;

  /// End the batch and return its balance rows without writing them.
  std::vector<remit::storage::key_value_entry_t> commit_batch_rows() override;

  /// Mint `amount` into `account`. Not allowed while a batch is staged.
  remit::schema::transfer_status credit(
      const remit::schema::principal_t& account,
      uint64_t amount);

  bool staging() const;

 private:
  uint64_t stored_balance(const remit::schema::principal_t& account) const;
  std::vector<remit::storage::key_value_entry_t> make_balance_rows(
      const std::map<remit::schema::principal_t, uint64_t>& balances);
  void write_balances(
      const std::map<remit::schema::principal_t, uint64_t>& balances);

  encoder_t& encoder_;
  storage_t& storage_;
  bool staging_{false};
  std::map<remit::schema::principal_t, uint64_t> staged_;
};

}  // namespace remit::ledger
