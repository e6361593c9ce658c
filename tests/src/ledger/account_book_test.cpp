#include <remit/ledger/account_book.hpp>
#include <remit/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <optional>

namespace {

using remit::schema::transfer_status;
using remit::testing::make_principal;

class account_book_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = remit::testing::make_db_path("remit_account_book");
    storage_.emplace(
        remit::storage::make_storage<remit::storage::rocksdb_storage_tag>(
            db_path_));
  }

  void TearDown() override {
    storage_.reset();
    remit::testing::remove_path(db_path_);
  }

  remit::ledger::account_book make_book() {
    return remit::ledger::account_book{encoder_, *storage_};
  }

  std::string db_path_;
  remit::ledger::account_book::encoder_t encoder_{};
  std::optional<remit::ledger::account_book::storage_t> storage_;
};

}  // namespace

TEST_F(account_book_test, credit_and_transfer_move_balances) {
  auto book = make_book();
  EXPECT_EQ(book.balance_of(make_principal(2)), 0u);
  EXPECT_EQ(book.credit(make_principal(2), 500), transfer_status::ok);
  EXPECT_EQ(book.transfer(200, make_principal(2), make_principal(3)),
            transfer_status::ok);
  EXPECT_EQ(book.balance_of(make_principal(2)), 300u);
  EXPECT_EQ(book.balance_of(make_principal(3)), 200u);
}

TEST_F(account_book_test, rejects_invalid_transfers) {
  auto book = make_book();
  ASSERT_EQ(book.credit(make_principal(2), 100), transfer_status::ok);
  EXPECT_EQ(book.transfer(0, make_principal(2), make_principal(3)),
            transfer_status::non_positive_amount);
  EXPECT_EQ(book.transfer(10, make_principal(2), make_principal(2)),
            transfer_status::same_principal);
  EXPECT_EQ(book.transfer(101, make_principal(2), make_principal(3)),
            transfer_status::insufficient_funds);
  EXPECT_EQ(book.credit(make_principal(2), 0),
            transfer_status::non_positive_amount);
  EXPECT_EQ(book.balance_of(make_principal(2)), 100u);
}

TEST_F(account_book_test, recipient_overflow_is_a_backend_failure) {
  auto book = make_book();
  ASSERT_EQ(book.credit(make_principal(2), 10), transfer_status::ok);
  ASSERT_EQ(book.credit(make_principal(3),
                        std::numeric_limits<uint64_t>::max()),
            transfer_status::ok);
  EXPECT_EQ(book.transfer(10, make_principal(2), make_principal(3)),
            transfer_status::backend_failure);
  EXPECT_EQ(book.credit(make_principal(3), 1), transfer_status::backend_failure);
}

TEST_F(account_book_test, committed_batch_persists_staged_transfers) {
  auto book = make_book();
  ASSERT_EQ(book.credit(make_principal(2), 100), transfer_status::ok);
  book.begin_batch();
  EXPECT_TRUE(book.staging());
  EXPECT_EQ(book.transfer(30, make_principal(2), make_principal(3)),
            transfer_status::ok);
  EXPECT_EQ(book.transfer(30, make_principal(2), make_principal(4)),
            transfer_status::ok);
  EXPECT_EQ(book.balance_of(make_principal(2)), 40u);
  EXPECT_EQ(book.credit(make_principal(2), 1), transfer_status::backend_failure);
  book.commit_batch();
  EXPECT_FALSE(book.staging());

  auto reloaded = make_book();
  EXPECT_EQ(reloaded.balance_of(make_principal(2)), 40u);
  EXPECT_EQ(reloaded.balance_of(make_principal(3)), 30u);
  EXPECT_EQ(reloaded.balance_of(make_principal(4)), 30u);
}

TEST_F(account_book_test, aborted_batch_leaves_no_balance_changes) {
  auto book = make_book();
  ASSERT_EQ(book.credit(make_principal(2), 100), transfer_status::ok);
  book.begin_batch();
  EXPECT_EQ(book.transfer(60, make_principal(2), make_principal(3)),
            transfer_status::ok);
  EXPECT_EQ(book.transfer(60, make_principal(2), make_principal(4)),
            transfer_status::insufficient_funds);
  book.abort_batch();

  EXPECT_EQ(book.balance_of(make_principal(2)), 100u);
  EXPECT_EQ(book.balance_of(make_principal(3)), 0u);
  EXPECT_EQ(make_book().balance_of(make_principal(3)), 0u);
}

TEST_F(account_book_test, batch_rows_are_returned_unwritten) {
  auto book = make_book();
  ASSERT_EQ(book.credit(make_principal(2), 100), transfer_status::ok);
  book.begin_batch();
  ASSERT_EQ(book.transfer(25, make_principal(2), make_principal(3)),
            transfer_status::ok);

  auto rows = book.commit_batch_rows();
  EXPECT_FALSE(book.staging());
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(make_book().balance_of(make_principal(2)), 100u);
  EXPECT_EQ(make_book().balance_of(make_principal(3)), 0u);

  storage_->write_batch(rows, {});
  EXPECT_EQ(make_book().balance_of(make_principal(2)), 75u);
  EXPECT_EQ(make_book().balance_of(make_principal(3)), 25u);
  EXPECT_TRUE(make_book().commit_batch_rows().empty());
}
