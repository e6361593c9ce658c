#include <remit/authorization/registry.hpp>
#include <remit/schema/error_code.hpp>
#include <remit/storage/rocksdb/storage.hpp>
#include <remit/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>

namespace {

using remit::testing::make_principal;

class registry_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = remit::testing::make_db_path("remit_registry");
    storage_.emplace(
        remit::storage::make_storage<remit::storage::rocksdb_storage_tag>(
            db_path_));
  }

  void TearDown() override {
    storage_.reset();
    remit::testing::remove_path(db_path_);
  }

  remit::authorization::registry make_registry(
      const remit::schema::principal_t& bootstrap_owner = make_principal(1)) {
    return remit::authorization::registry{encoder_, *storage_,
                                          bootstrap_owner};
  }

  std::string db_path_;
  remit::authorization::registry::encoder_t encoder_{};
  std::optional<remit::authorization::registry::storage_t> storage_;
};

}  // namespace

TEST_F(registry_test, unknown_principals_are_denied) {
  auto registry = make_registry();
  EXPECT_FALSE(registry.is_authorized(make_principal(2)));
  EXPECT_FALSE(registry.is_authorized(make_principal(1)));
  EXPECT_TRUE(registry.signers().empty());
}

TEST_F(registry_test, only_owner_may_add_signers) {
  auto registry = make_registry();
  auto denied = registry.add_signer(make_principal(2), make_principal(3));
  EXPECT_EQ(denied.code,
            static_cast<uint32_t>(remit::schema::error_code::unauthorized));
  EXPECT_FALSE(registry.is_authorized(make_principal(3)));

  EXPECT_TRUE(registry.add_signer(make_principal(1), make_principal(3)).ok());
  EXPECT_TRUE(registry.is_authorized(make_principal(3)));
}

TEST_F(registry_test, adding_twice_is_idempotent) {
  auto registry = make_registry();
  EXPECT_TRUE(registry.add_signer(make_principal(1), make_principal(3)).ok());
  EXPECT_TRUE(registry.add_signer(make_principal(1), make_principal(3)).ok());
  EXPECT_EQ(registry.signers().size(), 1u);
}

TEST_F(registry_test, removed_signers_are_denied) {
  auto registry = make_registry();
  ASSERT_TRUE(registry.add_signer(make_principal(1), make_principal(3)).ok());
  EXPECT_FALSE(
      registry.remove_signer(make_principal(3), make_principal(3)).ok());
  EXPECT_TRUE(registry.is_authorized(make_principal(3)));

  EXPECT_TRUE(
      registry.remove_signer(make_principal(1), make_principal(3)).ok());
  EXPECT_FALSE(registry.is_authorized(make_principal(3)));
  EXPECT_TRUE(
      registry.remove_signer(make_principal(1), make_principal(4)).ok());
}

TEST_F(registry_test, ownership_transfers_to_new_owner) {
  auto registry = make_registry();
  EXPECT_FALSE(registry.set_owner(make_principal(2), make_principal(2)).ok());
  EXPECT_TRUE(registry.set_owner(make_principal(1), make_principal(2)).ok());
  EXPECT_EQ(registry.owner(), make_principal(2));
  EXPECT_FALSE(registry.add_signer(make_principal(1), make_principal(5)).ok());
  EXPECT_TRUE(registry.add_signer(make_principal(2), make_principal(5)).ok());
}

TEST_F(registry_test, state_survives_reconstruction) {
  {
    auto registry = make_registry();
    ASSERT_TRUE(
        registry.add_signer(make_principal(1), make_principal(3)).ok());
    ASSERT_TRUE(registry.set_owner(make_principal(1), make_principal(2)).ok());
  }
  // A different bootstrap owner is ignored once one is persisted.
  auto reloaded = make_registry(make_principal(9));
  EXPECT_EQ(reloaded.owner(), make_principal(2));
  EXPECT_TRUE(reloaded.is_authorized(make_principal(3)));
  ASSERT_EQ(reloaded.signers().size(), 1u);
  EXPECT_EQ(reloaded.signers()[0], make_principal(3));
}

TEST_F(registry_test, load_owner_reads_without_bootstrapping) {
  using remit::authorization::registry;
  EXPECT_FALSE(registry::load_owner(encoder_, *storage_).has_value());
  EXPECT_FALSE(registry::load_owner(encoder_, *storage_).has_value());

  auto bootstrapped = make_registry(make_principal(5));
  EXPECT_EQ(registry::load_owner(encoder_, *storage_), make_principal(5));

  EXPECT_TRUE(
      bootstrapped.set_owner(make_principal(5), make_principal(6)).ok());
  EXPECT_EQ(registry::load_owner(encoder_, *storage_), make_principal(6));
  EXPECT_EQ(make_registry(make_principal(7)).owner(), make_principal(6));
}
