#pragma once

#include <courier/schema/primitives.hpp>
#include <optional>

// Client-side signing. The engine itself only ever recovers.
namespace courier::crypto {

using private_key_t = courier::schema::hash32_t;

std::optional<courier::schema::address_t> address_from_private_key(
    const private_key_t& private_key);

/// Low-s ECDSA signature over a raw 32-byte digest with v in {27, 28}.
std::optional<courier::schema::secp256k1_signature_t> sign_digest(
    const courier::schema::hash32_t& digest,
    const private_key_t& private_key);

}  // namespace courier::crypto
