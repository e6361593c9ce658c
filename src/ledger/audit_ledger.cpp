#include <remit/blake3/hash.hpp>
#include <remit/ledger/audit_ledger.hpp>
#include <remit/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace remit::schema;

namespace {

hash32_t fold_digest(const hash32_t& previous, const bytes_t& encoded_record) {
  auto material = bytes_t{};
  material.reserve(previous.size() + encoded_record.size());
  material.insert(std::end(material), std::begin(previous), std::end(previous));
  material.insert(std::end(material), std::begin(encoded_record),
                  std::end(encoded_record));
  return remit::blake3::hash(bytes_view_t{material.data(), material.size()});
}

}  // namespace

namespace remit::ledger {

audit_ledger::audit_ledger(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  auto last_key = key::make_last_execution_key();
  last_execution_ =
      storage_.get<block_height_t>(encoder_, make_bytes_view(last_key))
          .value_or(0);

  auto digest_key = key::make_ledger_digest_key();
  digest_ = storage_.get<hash32_t>(encoder_, make_bytes_view(digest_key))
                .value_or(make_zero_hash());
}

void audit_ledger::put(
    const batch_record_t& record,
    const std::vector<remit::storage::key_value_entry_t>& companion_rows) {
  auto record_key = key::make_batch_record_key(record.id);
  if (storage_.get<batch_record_t>(encoder_, make_bytes_view(record_key))) {
    spdlog::warn("Overwriting existing batch record {}", record.id);
  }

  auto encoded_record = encoder_.encode(record);
  auto next_digest = fold_digest(digest_, encoded_record);

  auto rows = companion_rows;
  rows.reserve(rows.size() + 3);
  rows.emplace_back(std::move(record_key), std::move(encoded_record));
  rows.emplace_back(key::make_ledger_digest_key(), encoder_.encode(next_digest));
  if (record.success) {
    rows.emplace_back(key::make_last_execution_key(),
                      encoder_.encode(record.timestamp));
  }
  storage_.write_batch(rows, {});

  digest_ = next_digest;
  if (record.success) {
    last_execution_ = record.timestamp;
  }
  spdlog::debug("Recorded batch {} (success={}, total={})", record.id,
                record.success, record.total_amount);
}

std::optional<batch_record_t> audit_ledger::get(uint64_t id) const {
  auto record_key = key::make_batch_record_key(id);
  return storage_.get<batch_record_t>(encoder_, make_bytes_view(record_key));
}

std::vector<batch_record_t> audit_ledger::records(uint64_t from_id,
                                                  uint64_t to_id) const {
  // Record keys carry little-endian ids, so key order is not id order.
  auto prefix = key::make_prefix_key(key::kBatchRecordPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));

  auto out = std::vector<batch_record_t>{};
  for (const auto& [row_key, value] : rows) {
    auto record = encoder_.try_decode<batch_record_t>(make_bytes_view(value));
    if (!record) {
      remit::common::critical("failed to decode batch record");
    }
    if (record->id >= from_id && record->id <= to_id) {
      out.push_back(*record);
    }
  }
  std::sort(std::begin(out), std::end(out),
            [](const batch_record_t& lhs, const batch_record_t& rhs) {
              return lhs.id < rhs.id;
            });
  return out;
}

block_height_t audit_ledger::last_execution() const {
  return last_execution_;
}

const hash32_t& audit_ledger::digest() const {
  return digest_;
}

}  // namespace remit::ledger
