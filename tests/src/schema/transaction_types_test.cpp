#include <gtest/gtest.h>
#include <courier/schema/app_info.hpp>
#include <courier/schema/authorization_status.hpp>
#include <courier/schema/token_config.hpp>
#include <courier/schema/transaction.hpp>
#include <courier/schema/transaction_error_code.hpp>
#include <courier/schema/transaction_result.hpp>

TEST(transaction_types, defaults_are_version_one) {
  auto tx = courier::schema::transaction_t{};
  EXPECT_EQ(tx.version, 1);
  EXPECT_EQ(tx.nonce, 0u);
  EXPECT_TRUE(
      std::holds_alternative<courier::schema::transfer_with_authorization_t>(
          tx.payload));

  auto result = courier::schema::transaction_result_t{};
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(result.events.empty());

  auto config = courier::schema::token_config_t{};
  EXPECT_EQ(config.eip712_version, "1");
  EXPECT_EQ(config.chain_id, 1);

  auto info = courier::schema::app_info_t{};
  EXPECT_EQ(info.data, "courier");
}

TEST(transaction_types, authorization_status_strings) {
  using courier::schema::authorization_status_t;
  using courier::schema::to_string;
  using courier::schema::try_from_string;
  EXPECT_EQ(to_string(authorization_status_t::unused), "unused");
  EXPECT_EQ(to_string(authorization_status_t::used), "used");
  EXPECT_EQ(to_string(authorization_status_t::canceled), "canceled");
  EXPECT_EQ(try_from_string<authorization_status_t>("canceled"),
            authorization_status_t::canceled);
  EXPECT_FALSE(try_from_string<authorization_status_t>("spent").has_value());
}

TEST(transaction_types, error_messages_are_distinct) {
  using courier::schema::kTransactionErrorMessages;
  using courier::schema::message;
  using courier::schema::transaction_error_code;
  EXPECT_EQ(message(transaction_error_code::invalid_chain_id),
            "wrong chain id");
  EXPECT_EQ(message(transaction_error_code::invalid_transaction_nonce),
            "invalid transaction nonce");
  EXPECT_EQ(message(transaction_error_code::invalid_transaction_signature),
            "invalid transaction signature");
  EXPECT_EQ(message(transaction_error_code::authorization_already_used),
            "authorization is used");
  EXPECT_EQ(message(transaction_error_code::authorization_not_yet_valid),
            "authorization is not yet valid");
  EXPECT_EQ(message(transaction_error_code::authorization_expired),
            "authorization is expired");
  EXPECT_EQ(message(transaction_error_code::invalid_signature),
            "invalid signature");
  EXPECT_EQ(message(transaction_error_code::caller_not_payee),
            "caller must be the payee");
  EXPECT_EQ(message(transaction_error_code::insufficient_balance),
            "transfer amount exceeds balance");

  for (std::size_t i = 0; i < kTransactionErrorMessages.size(); ++i) {
    for (std::size_t j = i + 1; j < kTransactionErrorMessages.size(); ++j) {
      EXPECT_NE(kTransactionErrorMessages[i].second,
                kTransactionErrorMessages[j].second);
    }
  }
}

TEST(transaction_types, token_config_equality_covers_domain_fields) {
  auto a = courier::schema::token_config_t{};
  a.name = "Token";
  auto b = a;
  EXPECT_EQ(a, b);
  b.chain_id = 5;
  EXPECT_NE(a, b);
}
