#pragma once

#include <courier/schema/primitives.hpp>
#include <optional>

namespace courier::crypto {

/// True when the linked OpenSSL exposes the secp256k1 curve.
bool available();

/// Ethereum address of an uncompressed public key, either 65 bytes with the
/// 0x04 prefix or the bare 64-byte X || Y form.
std::optional<courier::schema::address_t> address_from_public_key(
    const courier::schema::bytes_view_t& public_key);

/// Recover the signer address from a 32-byte digest.
///
/// Accepts v in {0, 1, 27, 28}. Rejects r outside (0, n), s outside
/// (0, n/2] and any r that is not the x coordinate of a curve point.
std::optional<courier::schema::address_t> recover_address(
    const courier::schema::hash32_t& digest,
    const courier::schema::secp256k1_signature_t& signature);

bool verify_signature(const courier::schema::hash32_t& digest,
                      const courier::schema::address_t& signer,
                      const courier::schema::secp256k1_signature_t& signature);

}  // namespace courier::crypto
