#include <courier/eip712/struct_hash.hpp>
#include <courier/execution/engine.hpp>
#include <courier/testing/authorization_harness.hpp>
#include <courier/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <tuple>

using namespace courier::schema;
using courier::testing::execution_fixture;

TEST(engine_types, defaults_are_stable) {
  auto tx = transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.log.empty());
  EXPECT_TRUE(tx.events.empty());

  auto query = query_result_t{};
  EXPECT_EQ(query.code, 0u);
  EXPECT_TRUE(query.value.empty());

  auto info = app_info_t{};
  EXPECT_EQ(info.data, "courier");
  EXPECT_EQ(info.version, "0.1.0");
}

TEST(engine_types, recoverer_callback_type_compiles) {
  auto recoverer = courier::execution::signature_recoverer_t{
      [](const hash32_t&, const secp256k1_signature_t&) {
        return std::optional<address_t>{};
      }};
  EXPECT_TRUE(static_cast<bool>(recoverer));
  EXPECT_FALSE(recoverer(hash32_t{}, secp256k1_signature_t{}).has_value());
}

TEST(engine_types, info_reports_token_and_domain) {
  auto fixture = execution_fixture{"courier_engine_info"};
  auto info = fixture.engine().info();
  EXPECT_EQ(info.token_name, "Token");
  EXPECT_EQ(info.token_symbol, "TOK");
  EXPECT_EQ(info.domain_separator, fixture.domain_separator());
  EXPECT_EQ(fixture.engine().total_supply(),
            amount_t{courier::testing::kGenesisSupply});
}

TEST(engine_types, type_hashes_match_eip712_helpers) {
  auto fixture = execution_fixture{"courier_engine_type_hashes"};
  auto hashes = fixture.engine().type_hashes();
  EXPECT_EQ(hashes.transfer_with_authorization,
            courier::eip712::transfer_with_authorization_typehash());
  EXPECT_EQ(hashes.receive_with_authorization,
            courier::eip712::receive_with_authorization_typehash());
  EXPECT_EQ(hashes.cancel_authorization,
            courier::eip712::cancel_authorization_typehash());
  EXPECT_NE(hashes.transfer_with_authorization,
            hashes.receive_with_authorization);
}

TEST(engine_types, authorization_state_query) {
  auto fixture = execution_fixture{"courier_engine_query_state"};
  auto nonce = courier::testing::make_hash(0x31);
  auto key = fixture.encoder().encode(std::tuple{fixture.holder(), nonce});

  auto before = fixture.engine().query("/authorization/state", key);
  ASSERT_EQ(before.code, 0u);
  EXPECT_EQ(before.key, key);
  EXPECT_EQ(before.info, "unused");
  EXPECT_EQ(fixture.encoder().decode<authorization_status_t>(before.value),
            authorization_status_t::unused);

  ASSERT_EQ(fixture.engine()
                .cancel_authorization(courier::testing::make_cancel(
                    fixture.domain_separator(), execution_fixture::holder_key(),
                    nonce))
                .code,
            0u);
  auto after = fixture.engine().query("/authorization/state", key);
  ASSERT_EQ(after.code, 0u);
  EXPECT_EQ(after.info, "canceled");
  EXPECT_EQ(fixture.encoder().decode<authorization_status_t>(after.value),
            authorization_status_t::canceled);
}

TEST(engine_types, balance_query) {
  auto fixture = execution_fixture{"courier_engine_query_balance"};
  auto& encoder = fixture.encoder();
  auto& engine = fixture.engine();
  auto result =
      engine.query("/ledger/balance", encoder.encode(fixture.holder()));
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.info, "10000000");
  EXPECT_EQ(fixture.encoder().decode<amount_t>(result.value),
            amount_t{courier::testing::kGenesisSupply});

  auto empty = engine.query("/ledger/balance", encoder.encode(fixture.other()));
  ASSERT_EQ(empty.code, 0u);
  EXPECT_EQ(empty.info, "0");
}

TEST(engine_types, envelope_nonce_query) {
  auto fixture = execution_fixture{"courier_engine_query_nonce"};
  auto& encoder = fixture.encoder();
  auto key = encoder.encode(fixture.holder());

  auto before = fixture.engine().query("/account/nonce", key);
  ASSERT_EQ(before.code, 0u);
  EXPECT_EQ(before.key, key);
  EXPECT_EQ(before.info, "0");
  EXPECT_EQ(encoder.decode<uint64_t>(before.value), 0u);

  auto payload = token_transfer_t{.to = fixture.other(), .value = 1};
  for (auto nonce = uint64_t{1}; nonce <= 2; ++nonce) {
    auto envelope =
        fixture.envelope(execution_fixture::holder_key(), nonce, payload);
    ASSERT_EQ(fixture.engine().execute_transaction(envelope).code, 0u);
  }
  auto after = fixture.engine().query("/account/nonce", key);
  ASSERT_EQ(after.code, 0u);
  EXPECT_EQ(after.info, "2");
  EXPECT_EQ(encoder.decode<uint64_t>(after.value), 2u);
  EXPECT_EQ(fixture.engine().envelope_nonce(fixture.holder()), 2u);
}

TEST(engine_types, token_config_and_domain_queries) {
  auto fixture = execution_fixture{"courier_engine_query_config"};
  auto config = fixture.engine().query("/token/config", bytes_t{});
  ASSERT_EQ(config.code, 0u);
  EXPECT_EQ(fixture.encoder().decode<token_config_t>(config.value),
            fixture.engine().token_config());

  auto domain = fixture.engine().query("/eip712/domain_separator", bytes_t{});
  ASSERT_EQ(domain.code, 0u);
  EXPECT_EQ(fixture.encoder().decode<hash32_t>(domain.value),
            fixture.domain_separator());
  EXPECT_EQ(domain.info, to_hex(fixture.domain_separator()));

  auto hashes = fixture.engine().query("/eip712/type_hashes", bytes_t{});
  ASSERT_EQ(hashes.code, 0u);
  auto decoded =
      fixture.encoder().decode<std::tuple<hash32_t, hash32_t, hash32_t>>(
          hashes.value);
  EXPECT_EQ(std::get<0>(decoded),
            courier::eip712::transfer_with_authorization_typehash());
  EXPECT_EQ(std::get<1>(decoded),
            courier::eip712::receive_with_authorization_typehash());
  EXPECT_EQ(std::get<2>(decoded),
            courier::eip712::cancel_authorization_typehash());
}

TEST(engine_types, query_errors) {
  auto fixture = execution_fixture{"courier_engine_query_errors"};
  auto unknown = fixture.engine().query("/nope", bytes_t{});
  EXPECT_EQ(unknown.code,
            static_cast<uint32_t>(query_error_code::unsupported_path));
  EXPECT_EQ(unknown.codespace, courier::execution::kQueryCodespace);

  auto short_key = bytes_t{0x01, 0x02};
  auto state = fixture.engine().query("/authorization/state", short_key);
  EXPECT_EQ(state.code, static_cast<uint32_t>(query_error_code::invalid_key));
  EXPECT_EQ(state.key, short_key);

  auto balance = fixture.engine().query("/ledger/balance", short_key);
  EXPECT_EQ(balance.code, static_cast<uint32_t>(query_error_code::invalid_key));

  auto nonce = fixture.engine().query("/account/nonce", short_key);
  EXPECT_EQ(nonce.code, static_cast<uint32_t>(query_error_code::invalid_key));
}
