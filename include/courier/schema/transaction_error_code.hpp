#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace courier::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_transaction_nonce = 4,
  invalid_transaction_signature = 5,
  authorization_already_used = 10,
  authorization_not_yet_valid = 11,
  authorization_expired = 12,
  invalid_signature = 13,
  caller_not_payee = 14,
  insufficient_balance = 20,
  transfer_from_zero_address = 21,
  transfer_to_zero_address = 22,
};

/// Human readable reason reported in `transaction_result_t::log`.
inline constexpr auto kTransactionErrorMessages = std::array{
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::invalid_transaction, "invalid transaction"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::invalid_chain_id, "wrong chain id"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::invalid_transaction_nonce,
        "invalid transaction nonce"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::invalid_transaction_signature,
        "invalid transaction signature"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::authorization_already_used,
        "authorization is used"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::authorization_not_yet_valid,
        "authorization is not yet valid"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::authorization_expired,
        "authorization is expired"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::invalid_signature, "invalid signature"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::caller_not_payee, "caller must be the payee"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::insufficient_balance,
        "transfer amount exceeds balance"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::transfer_from_zero_address,
        "transfer from the zero address"},
    std::pair<transaction_error_code, std::string_view>{
        transaction_error_code::transfer_to_zero_address,
        "transfer to the zero address"}};

inline constexpr std::string_view message(const transaction_error_code code) {
  for (const auto& [value, text] : kTransactionErrorMessages) {
    if (value == code) {
      return text;
    }
  }
  return "unknown error";
}

}  // namespace courier::schema
