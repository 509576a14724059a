#pragma once
#include <courier/schema/primitives.hpp>

// Schema type: receive with authorization.
// Same fields as a transfer authorization, but only `to` may submit it.
namespace courier::schema {

template <uint16_t Version>
struct receive_with_authorization;

template <>
struct receive_with_authorization<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  amount_t value{};
  uint256_t valid_after{};
  uint256_t valid_before{};
  nonce_t nonce{};
  secp256k1_signature_t signature{};
};

using receive_with_authorization_t = receive_with_authorization<1>;

}  // namespace courier::schema
