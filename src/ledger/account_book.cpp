#include <remit/ledger/account_book.hpp>
#include <remit/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <vector>

using namespace remit::schema;

namespace remit::ledger {

account_book::account_book(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

uint64_t account_book::balance_of(const principal_t& account) const {
  if (staging_) {
    auto staged = staged_.find(account);
    if (staged != std::end(staged_)) {
      return staged->second;
    }
  }
  return stored_balance(account);
}

transfer_status account_book::transfer(uint64_t amount,
                                       const principal_t& from,
                                       const principal_t& to) {
  if (amount == 0) {
    return transfer_status::non_positive_amount;
  }
  if (from == to) {
    return transfer_status::same_principal;
  }
  auto from_balance = balance_of(from);
  if (from_balance < amount) {
    return transfer_status::insufficient_funds;
  }
  auto to_balance = balance_of(to);
  if (to_balance > std::numeric_limits<uint64_t>::max() - amount) {
    spdlog::error("Recipient balance would overflow");
    return transfer_status::backend_failure;
  }

  auto updated = std::map<principal_t, uint64_t>{
      {from, from_balance - amount}, {to, to_balance + amount}};
  if (staging_) {
    for (const auto& [account, balance] : updated) {
      staged_[account] = balance;
    }
  } else {
    write_balances(updated);
  }
  return transfer_status::ok;
}

void account_book::begin_batch() {
  if (staging_) {
    spdlog::warn("Discarding {} staged balance(s) from an unfinished batch",
                 staged_.size());
  }
  staged_.clear();
  staging_ = true;
}

void account_book::commit_batch() {
  if (!staging_) {
    return;
  }
  write_balances(staged_);
  staged_.clear();
  staging_ = false;
}

std::vector<remit::storage::key_value_entry_t>
account_book::commit_batch_rows() {
  if (!staging_) {
    return {};
  }
  auto rows = make_balance_rows(staged_);
  staged_.clear();
  staging_ = false;
  return rows;
}

void account_book::abort_batch() {
  if (!staging_) {
    return;
  }
  spdlog::info("Discarding {} staged balance(s)", staged_.size());
  staged_.clear();
  staging_ = false;
}

transfer_status account_book::credit(const principal_t& account,
                                     uint64_t amount) {
  if (staging_) {
    spdlog::error("Credit rejected while a batch is staged");
    return transfer_status::backend_failure;
  }
  if (amount == 0) {
    return transfer_status::non_positive_amount;
  }
  auto balance = stored_balance(account);
  if (balance > std::numeric_limits<uint64_t>::max() - amount) {
    return transfer_status::backend_failure;
  }
  write_balances({{account, balance + amount}});
  return transfer_status::ok;
}

bool account_book::staging() const {
  return staging_;
}

uint64_t account_book::stored_balance(const principal_t& account) const {
  auto key = key::make_balance_key(account);
  return storage_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

std::vector<remit::storage::key_value_entry_t> account_book::make_balance_rows(
    const std::map<principal_t, uint64_t>& balances) {
  auto rows = std::vector<remit::storage::key_value_entry_t>{};
  rows.reserve(balances.size());
  for (const auto& [account, balance] : balances) {
    rows.emplace_back(key::make_balance_key(account), encoder_.encode(balance));
  }
  return rows;
}

void account_book::write_balances(
    const std::map<principal_t, uint64_t>& balances) {
  storage_.write_batch(make_balance_rows(balances), {});
}

}  // namespace remit::ledger
