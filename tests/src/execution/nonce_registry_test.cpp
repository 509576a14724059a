#include <gtest/gtest.h>
#include <courier/execution/nonce_registry.hpp>
#include <courier/testing/common.hpp>

using courier::schema::authorization_status_t;
using courier::testing::make_address;
using courier::testing::make_hash;

namespace {

using write_batch_t = courier::execution::nonce_registry::write_batch_t;

class nonce_registry_test : public ::testing::Test {
 protected:
  nonce_registry_test()
      : db_path_{courier::testing::make_db_path("courier_nonce_registry")},
        storage_{courier::storage::make_storage<
            courier::storage::rocksdb_storage_tag>(db_path_)},
        registry_{encoder_, storage_} {}

  ~nonce_registry_test() override { courier::testing::remove_path(db_path_); }

  std::string db_path_;
  courier::testing::scale_encoder_t encoder_;
  courier::storage::storage<courier::storage::rocksdb_storage_tag> storage_;
  courier::execution::nonce_registry registry_;
};

}  // namespace

TEST_F(nonce_registry_test, absent_entries_are_unused) {
  EXPECT_EQ(registry_.status(make_address(0x01), make_hash(0x01)),
            authorization_status_t::unused);
  EXPECT_FALSE(registry_.used(make_address(0x01), make_hash(0x01)));
}

TEST_F(nonce_registry_test, staged_entries_are_visible_only_through_the_batch) {
  auto batch = write_batch_t{storage_};
  registry_.stage(batch, make_address(0x01), make_hash(0x01),
                  authorization_status_t::used);
  EXPECT_TRUE(registry_.used(batch, make_address(0x01), make_hash(0x01)));
  EXPECT_FALSE(registry_.used(make_address(0x01), make_hash(0x01)));

  storage_.commit(batch);
  EXPECT_TRUE(registry_.used(make_address(0x01), make_hash(0x01)));
  EXPECT_EQ(registry_.status(make_address(0x01), make_hash(0x01)),
            authorization_status_t::used);
}

TEST_F(nonce_registry_test, nonces_are_scoped_per_authorizer) {
  auto batch = write_batch_t{storage_};
  registry_.stage(batch, make_address(0x01), make_hash(0x07),
                  authorization_status_t::canceled);
  storage_.commit(batch);

  EXPECT_EQ(registry_.status(make_address(0x01), make_hash(0x07)),
            authorization_status_t::canceled);
  EXPECT_FALSE(registry_.used(make_address(0x02), make_hash(0x07)));
  EXPECT_FALSE(registry_.used(make_address(0x01), make_hash(0x08)));
}

TEST_F(nonce_registry_test, nonces_may_be_consumed_in_any_order) {
  auto batch = write_batch_t{storage_};
  registry_.stage(batch, make_address(0x01), make_hash(0x09),
                  authorization_status_t::used);
  registry_.stage(batch, make_address(0x01), make_hash(0x02),
                  authorization_status_t::used);
  storage_.commit(batch);
  EXPECT_TRUE(registry_.used(make_address(0x01), make_hash(0x09)));
  EXPECT_TRUE(registry_.used(make_address(0x01), make_hash(0x02)));
  EXPECT_FALSE(registry_.used(make_address(0x01), make_hash(0x05)));
}

TEST_F(nonce_registry_test, discarded_batch_keeps_nonce_unused) {
  {
    auto batch = write_batch_t{storage_};
    registry_.stage(batch, make_address(0x01), make_hash(0x03),
                    authorization_status_t::used);
  }
  EXPECT_FALSE(registry_.used(make_address(0x01), make_hash(0x03)));
}

TEST_F(nonce_registry_test, consumed_entries_cannot_be_restaged) {
  auto batch = write_batch_t{storage_};
  registry_.stage(batch, make_address(0x01), make_hash(0x04),
                  authorization_status_t::used);
  storage_.commit(batch);

  EXPECT_DEATH(
      {
        auto again = write_batch_t{storage_};
        registry_.stage(again, make_address(0x01), make_hash(0x04),
                        authorization_status_t::canceled);
      },
      "");
}

TEST_F(nonce_registry_test, staging_unused_is_fatal) {
  EXPECT_DEATH(
      {
        auto batch = write_batch_t{storage_};
        registry_.stage(batch, make_address(0x01), make_hash(0x05),
                        authorization_status_t::unused);
      },
      "");
}
