#include <remit/schema/key/engine_keys.hpp>

#include <remit/schema/encoding/scale/encoder.hpp>

#include <iterator>
#include <string_view>

namespace remit::schema::key {

namespace {

using key_encoder_t = remit::schema::encoding::encoder<
    remit::schema::encoding::scale_encoder_tag>;

remit::schema::bytes_t singleton_key(std::string_view prefix) {
  return make_prefixed_key(prefix,
                           key_encoder_t{}.encode(std::string_view{"CURRENT"}));
}

}  // namespace

remit::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const remit::schema::bytes_t& id) {
  auto key = make_prefix_key(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

remit::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return remit::schema::make_bytes(prefix);
}

remit::schema::bytes_t make_owner_key() {
  return singleton_key(kOwnerKeyPrefix);
}

remit::schema::bytes_t make_signer_key(
    const remit::schema::principal_t& signer) {
  return make_prefixed_key(kSignerKeyPrefix,
                           remit::schema::bytes_t{std::begin(signer),
                                                  std::end(signer)});
}

remit::schema::bytes_t make_engine_state_key() {
  return singleton_key(kEngineStateKeyPrefix);
}

remit::schema::bytes_t make_last_execution_key() {
  return singleton_key(kLastExecutionKeyPrefix);
}

remit::schema::bytes_t make_ledger_digest_key() {
  return singleton_key(kLedgerDigestKeyPrefix);
}

remit::schema::bytes_t make_batch_record_key(uint64_t batch_id) {
  return make_prefixed_key(kBatchRecordPrefix,
                           key_encoder_t{}.encode(batch_id));
}

remit::schema::bytes_t make_balance_key(
    const remit::schema::principal_t& account) {
  return make_prefixed_key(kBalanceKeyPrefix,
                           remit::schema::bytes_t{std::begin(account),
                                                  std::end(account)});
}

}  // namespace remit::schema::key
