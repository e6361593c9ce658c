#pragma once

#include <remit/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Batch workflow: canonical key prefixes and key builders for registry,
// engine counters, audit records, and reference account balances.
namespace remit::schema::key {

inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kSignerKeyPrefix{"SYS|STATE|SIGNER|"};
inline constexpr std::string_view kEngineStateKeyPrefix{"SYS|STATE|ENGINE|"};
inline constexpr std::string_view kLastExecutionKeyPrefix{
    "SYS|STATE|LAST_EXECUTION|"};
inline constexpr std::string_view kLedgerDigestKeyPrefix{
    "SYS|STATE|LEDGER_DIGEST|"};
inline constexpr std::string_view kBatchRecordPrefix{"SYS|RECORD|BATCH|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|ACCOUNT|BALANCE|"};

/// Raw prefix bytes followed by the id bytes.
remit::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const remit::schema::bytes_t& id);

remit::schema::bytes_t make_prefix_key(std::string_view prefix);

remit::schema::bytes_t make_owner_key();
remit::schema::bytes_t make_signer_key(
    const remit::schema::principal_t& signer);
remit::schema::bytes_t make_engine_state_key();
remit::schema::bytes_t make_last_execution_key();
remit::schema::bytes_t make_ledger_digest_key();
remit::schema::bytes_t make_batch_record_key(uint64_t batch_id);
remit::schema::bytes_t make_balance_key(
    const remit::schema::principal_t& account);

}  // namespace remit::schema::key
