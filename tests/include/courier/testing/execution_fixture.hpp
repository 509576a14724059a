#pragma once

#include <courier/execution/engine.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/token_config.hpp>
#include <courier/storage/rocksdb/storage.hpp>
#include <courier/testing/authorization_harness.hpp>
#include <courier/testing/common.hpp>

#include <string>
#include <string_view>

namespace courier::testing {

inline constexpr auto kGenesisSupply = uint64_t{10'000'000};
inline constexpr auto kGenesisTime = uint64_t{1'700'000'000};
inline constexpr auto kChainId = uint64_t{1};

inline courier::schema::token_config_t make_token_config(
    const courier::schema::address_t& initial_holder) {
  auto config = courier::schema::token_config_t{};
  config.name = "Token";
  config.eip712_version = "1";
  config.symbol = "TOK";
  config.decimals = 6;
  config.chain_id = kChainId;
  config.verifying_contract = make_address(0xcc);
  config.total_supply = kGenesisSupply;
  config.initial_holder = initial_holder;
  return config;
}

/// Engine over a temporary RocksDB with a settable clock. The genesis supply
/// belongs to `holder_key()`.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{courier::storage::make_storage<
            courier::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_,
                make_token_config(address_of(holder_key())),
                [this] { return now_; }} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  static courier::schema::hash32_t holder_key() { return make_private_key(1); }
  static courier::schema::hash32_t other_key() { return make_private_key(2); }

  courier::schema::address_t holder() const { return address_of(holder_key()); }
  courier::schema::address_t other() const { return address_of(other_key()); }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }
  courier::storage::storage<courier::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }
  courier::execution::engine& engine() { return engine_; }

  courier::schema::hash32_t domain_separator() const {
    return engine_.domain_separator();
  }

  /// Signed envelope from `signer_key` under this fixture's domain.
  courier::schema::bytes_t envelope(
      const courier::schema::hash32_t& signer_key,
      const uint64_t nonce,
      const courier::schema::transaction_payload_t& payload) const {
    return encode_transaction(make_transaction(
        domain_separator(), kChainId, signer_key, nonce, payload));
  }

  void set_now(const uint64_t now) { now_ = now; }
  uint64_t now() const { return now_; }

 private:
  std::string db_path_;
  uint64_t now_{kGenesisTime};
  scale_encoder_t encoder_;
  courier::storage::storage<courier::storage::rocksdb_storage_tag> storage_;
  courier::execution::engine engine_;
};

}  // namespace courier::testing
