#pragma once
#include <courier/schema/primitives.hpp>

namespace courier::schema {

template <uint16_t Version>
struct cancel_authorization;

template <>
struct cancel_authorization<1> final {
  uint16_t version{1};
  address_t authorizer{};
  nonce_t nonce{};
  secp256k1_signature_t signature{};
};

using cancel_authorization_t = cancel_authorization<1>;

}  // namespace courier::schema
