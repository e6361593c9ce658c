#pragma once

#include <remit/schema/primitives.hpp>
#include <remit/schema/transfer_status.hpp>
#include <remit/storage/storage.hpp>

#include <cstdint>
#include <vector>

namespace remit::execution {

/// Ledger that holds balances and moves value between principals.
///
/// Each `transfer` call is atomic on its own. The batch hooks bracket one
/// batch: a transactional backend stages transfers after `begin_batch` and
/// discards them on `abort_batch`. Backends without staging keep the no-op
/// defaults, in which case transfers applied before a failure remain applied.
///
/// `commit_batch_rows` lets a backend sharing the engine's store hand its
/// staged writes back instead of committing them, so they land in the same
/// atomic write as the batch record.
class transfer_service {
 public:
  virtual ~transfer_service() = default;

  virtual uint64_t balance_of(const remit::schema::principal_t& account) const = 0;

  virtual remit::schema::transfer_status transfer(
      uint64_t amount,
      const remit::schema::principal_t& from,
      const remit::schema::principal_t& to) = 0;

  virtual void begin_batch() {}
  virtual void commit_batch() {}
  virtual void abort_batch() {}

  virtual std::vector<remit::storage::key_value_entry_t> commit_batch_rows() {
    commit_batch();
    return {};
  }
};

}  // namespace remit::execution
