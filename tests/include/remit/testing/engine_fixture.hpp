#pragma once

#include <remit/clock/clock_source.hpp>
#include <remit/execution/engine.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/storage/rocksdb/storage.hpp>
#include <remit/testing/common.hpp>
#include <remit/testing/scripted_transfer_service.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace remit::testing {

using scale_encoder_t = remit::schema::encoding::encoder<
    remit::schema::encoding::scale_encoder_tag>;
using storage_t =
    remit::storage::storage<remit::storage::rocksdb_storage_tag>;

/// Engine over a scratch RocksDB database, a scripted transfer service and a
/// manual clock. The bootstrap owner is `make_principal(1)`.
class engine_fixture final {
 public:
  explicit engine_fixture(
      const std::string_view db_prefix,
      remit::execution::engine_config config = {},
      remit::execution::transfer_service* transfers = nullptr)
      : db_path_{make_db_path(db_prefix)},
        config_{config},
        transfers_{transfers},
        clock_{height_at_hour(10)} {
    open();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    storage_.reset();
    remove_path(db_path_);
  }

  /// Close the database and construct a fresh engine over it.
  void restart() {
    engine_.reset();
    storage_.reset();
    open();
  }

  static remit::schema::principal_t owner() { return make_principal(1); }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return *storage_; }
  remit::clock::manual_height_source& clock() { return clock_; }
  scripted_transfer_service& transfers() { return scripted_; }
  remit::execution::engine& engine() { return *engine_; }

 private:
  void open() {
    storage_.emplace(
        remit::storage::make_storage<remit::storage::rocksdb_storage_tag>(
            db_path_));
    auto& transfers = transfers_ != nullptr
                          ? *transfers_
                          : static_cast<remit::execution::transfer_service&>(
                                scripted_);
    engine_.emplace(encoder_, *storage_, transfers, clock_, owner(), config_);
  }

  std::string db_path_;
  remit::execution::engine_config config_;
  remit::execution::transfer_service* transfers_{nullptr};
  scale_encoder_t encoder_{};
  std::optional<storage_t> storage_;
  scripted_transfer_service scripted_;
  remit::clock::manual_height_source clock_;
  std::optional<remit::execution::engine> engine_;
};

}  // namespace remit::testing
