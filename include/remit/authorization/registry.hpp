#pragma once

#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/operation_result.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/storage/rocksdb/storage.hpp>

#include <optional>
#include <vector>

namespace remit::authorization {

/// Owner role plus the set of principals allowed to authorize high value
/// batches.
///
/// Every mutation is owner-only and persisted immediately. Unknown principals
/// are never authorized. The registry does not lock; the engine serializes
/// access to it.
class registry final {
 public:
  using encoder_t = remit::schema::encoding::encoder<
      remit::schema::encoding::scale_encoder_tag>;
  using storage_t =
      remit::storage::storage<remit::storage::rocksdb_storage_tag>;

  /// Load the persisted owner, or persist `bootstrap_owner` when the store
  /// has none yet.
  registry(encoder_t& encoder,
           storage_t& storage,
           const remit::schema::principal_t& bootstrap_owner);

  /// The persisted owner, if the store has one.
  static std::optional<remit::schema::principal_t> load_owner(
      encoder_t& encoder,
      const storage_t& storage);

  /// Replace the owner. Only the current owner may call this.
  remit::schema::operation_result_t set_owner(
      const remit::schema::principal_t& caller,
      const remit::schema::principal_t& new_owner);

  /// Flag `signer` as authorized. Re-adding an existing signer succeeds.
  remit::schema::operation_result_t add_signer(
      const remit::schema::principal_t& caller,
      const remit::schema::principal_t& signer);

  /// Clear the authorized flag. Removing an unknown signer succeeds.
  remit::schema::operation_result_t remove_signer(
      const remit::schema::principal_t& caller,
      const remit::schema::principal_t& signer);

  bool is_authorized(const remit::schema::principal_t& identity) const;
  bool is_owner(const remit::schema::principal_t& identity) const;
  const remit::schema::principal_t& owner() const;

  /// All authorized signers in storage key order.
  std::vector<remit::schema::principal_t> signers() const;

 private:
  remit::schema::operation_result_t deny(
      const remit::schema::principal_t& caller,
      std::string_view operation) const;

  encoder_t& encoder_;
  storage_t& storage_;
  remit::schema::principal_t owner_{};
};

}  // namespace remit::authorization
