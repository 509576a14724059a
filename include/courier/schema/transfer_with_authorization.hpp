#pragma once
#include <courier/schema/primitives.hpp>

// Schema type: transfer with authorization.
// Signed instruction moving `value` from `from` to `to`; any party may
// relay it inside [valid_after, valid_before).
namespace courier::schema {

template <uint16_t Version>
struct transfer_with_authorization;

template <>
struct transfer_with_authorization<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  amount_t value{};
  uint256_t valid_after{};
  uint256_t valid_before{};
  nonce_t nonce{};
  secp256k1_signature_t signature{};
};

using transfer_with_authorization_t = transfer_with_authorization<1>;

}  // namespace courier::schema
