#pragma once

#include <courier/schema/primitives.hpp>
#include <string_view>
#include <tuple>

// Canonical key prefixes and key builders for persisted engine state.
namespace courier::schema::key {

inline constexpr std::string_view kAuthorizationKeyPrefix{
    "SYS|STATE|AUTHORIZATION|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kTotalSupplyKey{"SYS|STATE|SUPPLY"};
inline constexpr std::string_view kTokenConfigKey{"SYS|TOKEN|CONFIG"};

template <typename Encoder, typename T>
courier::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
courier::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
courier::schema::bytes_t make_authorization_key(
    Encoder& encoder,
    const courier::schema::address_t& authorizer,
    const courier::schema::nonce_t& nonce) {
  return make_prefixed_key(encoder, kAuthorizationKeyPrefix,
                           std::tuple{authorizer, nonce});
}

template <typename Encoder>
courier::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const courier::schema::address_t& holder) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, holder);
}

template <typename Encoder>
courier::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const courier::schema::address_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
courier::schema::bytes_t make_total_supply_key(Encoder& encoder) {
  return make_prefix_key(encoder, kTotalSupplyKey);
}

template <typename Encoder>
courier::schema::bytes_t make_token_config_key(Encoder& encoder) {
  return make_prefix_key(encoder, kTokenConfigKey);
}

}  // namespace courier::schema::key
