#include <remit/common/critical.hpp>
#include <remit/storage/rocksdb/storage.hpp>

#include <string>

namespace remit::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    remit::common::critical("RocksDB path must not be empty");
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  // Engine rows are tiny and written one batch at a time.
  options.IncreaseParallelism(2);
  options.OptimizeLevelStyleCompaction();

  auto* database = static_cast<ROCKSDB_NAMESPACE::DB*>(nullptr);
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    remit::common::critical("Failed to open RocksDB at {}: {}", path,
                            status.ToString());
  }
  spdlog::debug("Opened RocksDB at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace remit::storage
