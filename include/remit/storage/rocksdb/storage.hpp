#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <remit/common/critical.hpp>
#include <remit/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace remit::storage {

namespace detail {

inline remit::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const remit::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const remit::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const remit::schema::bytes_view_t& key,
           const T& value) const;

  void remove(const remit::schema::bytes_view_t& key) const;
  void write_batch(const std::vector<key_value_entry_t>& puts,
                   const std::vector<remit::schema::bytes_t>& deletes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const remit::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const remit::schema::bytes_view_t& key) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      remit::common::critical("Failed to get value from RocksDB: {}",
                              status.ToString());
    }
  }
  return {encoder.template decode<T>(remit::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const remit::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(remit::schema::bytes_view_t{encoded_value.data(),
                                                   encoded_value.size()}));
  if (!status.ok()) {
    remit::common::critical("Failed to put value into RocksDB: {}",
                            status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::remove(
    const remit::schema::bytes_view_t& key) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    remit::common::critical("Failed to delete value from RocksDB: {}",
                            status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& puts,
    const std::vector<remit::schema::bytes_t>& deletes) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : deletes) {
    auto delete_status = batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      remit::common::critical("failed deleting key in write batch");
    }
  }
  for (const auto& [key, value] : puts) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      remit::common::critical("failed writing key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    remit::common::critical("Failed to commit write batch: {}",
                            write_status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const remit::schema::bytes_view_t& prefix) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    remit::common::critical("RocksDB iteration failed: {}",
                            iterator->status().ToString());
  }
  return entries;
}

}  // namespace remit::storage
