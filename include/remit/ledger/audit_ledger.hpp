#pragma once

#include <remit/schema/batch_record.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace remit::ledger {

/// Append-by-key store of batch outcomes.
///
/// Records are keyed by batch id and never rewritten by the engine. The
/// ledger also tracks the timestamp of the latest successful batch and a
/// running blake3 digest over every record written:
///
///   digest_n = blake3(digest_{n-1} || SCALE(record_n)), digest_0 = zero hash
class audit_ledger final {
 public:
  using encoder_t = remit::schema::encoding::encoder<
      remit::schema::encoding::scale_encoder_tag>;
  using storage_t =
      remit::storage::storage<remit::storage::rocksdb_storage_tag>;

  audit_ledger(encoder_t& encoder, storage_t& storage);

  /// Persist `record`, the advanced digest, the last execution timestamp when
  /// the record is a success, and `companion_rows` in one atomic write.
  void put(const remit::schema::batch_record_t& record,
           const std::vector<remit::storage::key_value_entry_t>&
               companion_rows = {});

  std::optional<remit::schema::batch_record_t> get(uint64_t id) const;

  /// Records with ids in [from_id, to_id]; missing ids are skipped.
  std::vector<remit::schema::batch_record_t> records(uint64_t from_id,
                                                     uint64_t to_id) const;

  /// Timestamp of the latest successful batch, 0 before the first one.
  remit::schema::block_height_t last_execution() const;

  const remit::schema::hash32_t& digest() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  remit::schema::block_height_t last_execution_{};
  remit::schema::hash32_t digest_{};
};

}  // namespace remit::ledger
