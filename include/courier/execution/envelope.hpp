#pragma once
#include <courier/schema/primitives.hpp>
#include <courier/schema/transaction.hpp>

namespace courier::execution {

/// keccak over the SCALE envelope with its signature cleared.
courier::schema::hash32_t envelope_hash(
    const courier::schema::transaction_t& tx);

/// Digest the envelope signer signs. Framed like an EIP-712 digest so an
/// envelope signature is only valid for one token domain.
courier::schema::hash32_t envelope_digest(
    const courier::schema::hash32_t& domain_separator,
    const courier::schema::transaction_t& tx);

}  // namespace courier::execution
