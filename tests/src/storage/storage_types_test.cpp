#include <courier/schema/authorization_status.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/key/engine_keys.hpp>
#include <courier/storage/rocksdb/storage.hpp>
#include <courier/storage/storage.hpp>
#include <courier/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using write_batch_t =
    courier::storage::write_batch<courier::storage::rocksdb_storage_tag>;
using courier::schema::amount_t;
using courier::testing::scale_encoder_t;

auto open_storage(const std::string& db) {
  return courier::storage::make_storage<courier::storage::rocksdb_storage_tag>(
      db);
}

}  // namespace

TEST(storage_types, put_then_get_round_trips) {
  auto db = courier::testing::make_db_path("courier_storage_put");
  {
    auto storage = open_storage(db);
    auto encoder = scale_encoder_t{};
    auto key = courier::schema::key::make_balance_key(
        encoder, courier::testing::make_address(0x01));
    EXPECT_FALSE(storage.get<amount_t>(encoder, key).has_value());

    storage.put(encoder, key, amount_t{42});
    auto loaded = storage.get<amount_t>(encoder, key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 42);
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, batch_reads_its_own_writes_before_commit) {
  auto db = courier::testing::make_db_path("courier_storage_batch_read");
  {
    auto storage = open_storage(db);
    auto encoder = scale_encoder_t{};
    auto key = courier::schema::key::make_total_supply_key(encoder);
    storage.put(encoder, key, amount_t{1});

    auto batch = write_batch_t{storage};
    EXPECT_EQ(batch.get<amount_t>(encoder, key), 1);
    batch.put(encoder, key, amount_t{2});
    EXPECT_EQ(batch.get<amount_t>(encoder, key), 2);
    EXPECT_EQ(storage.get<amount_t>(encoder, key), 1);
    EXPECT_EQ(batch.size(), 1u);
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, commit_applies_all_staged_writes) {
  auto db = courier::testing::make_db_path("courier_storage_commit");
  {
    auto storage = open_storage(db);
    auto encoder = scale_encoder_t{};
    auto first = courier::schema::key::make_balance_key(
        encoder, courier::testing::make_address(0x01));
    auto second = courier::schema::key::make_balance_key(
        encoder, courier::testing::make_address(0x02));

    auto batch = write_batch_t{storage};
    batch.put(encoder, first, amount_t{10});
    batch.put(encoder, second, amount_t{20});
    storage.commit(batch);

    EXPECT_EQ(storage.get<amount_t>(encoder, first), 10);
    EXPECT_EQ(storage.get<amount_t>(encoder, second), 20);
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, discarded_batch_leaves_state_untouched) {
  auto db = courier::testing::make_db_path("courier_storage_discard");
  {
    auto storage = open_storage(db);
    auto encoder = scale_encoder_t{};
    auto key = courier::schema::key::make_balance_key(
        encoder, courier::testing::make_address(0x01));
    {
      auto batch = write_batch_t{storage};
      batch.put(encoder, key, amount_t{99});
    }
    EXPECT_FALSE(storage.get<amount_t>(encoder, key).has_value());
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, list_by_prefix_only_returns_matching_keys) {
  auto db = courier::testing::make_db_path("courier_storage_prefix");
  {
    auto storage = open_storage(db);
    auto encoder = scale_encoder_t{};
    storage.put(encoder,
                courier::schema::key::make_balance_key(
                    encoder, courier::testing::make_address(0x01)),
                amount_t{1});
    storage.put(encoder,
                courier::schema::key::make_balance_key(
                    encoder, courier::testing::make_address(0x02)),
                amount_t{2});
    storage.put(encoder, courier::schema::key::make_total_supply_key(encoder),
                amount_t{3});

    auto prefix = courier::schema::key::make_prefix_key(
        encoder, courier::schema::key::kBalanceKeyPrefix);
    auto entries = storage.list_by_prefix(prefix);
    EXPECT_EQ(entries.size(), 2u);
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, data_survives_reopen) {
  auto db = courier::testing::make_db_path("courier_storage_reopen");
  auto encoder = scale_encoder_t{};
  auto key = courier::schema::key::make_authorization_key(
      encoder, courier::testing::make_address(0x01),
      courier::testing::make_hash(0x02));
  {
    auto storage = open_storage(db);
    storage.put(encoder, key, courier::schema::authorization_status_t::used);
  }
  {
    auto storage = open_storage(db);
    using courier::schema::authorization_status_t;
    EXPECT_EQ(storage.get<authorization_status_t>(encoder, key),
              authorization_status_t::used);
  }
  courier::testing::remove_path(db);
}
