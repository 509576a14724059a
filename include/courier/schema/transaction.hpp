#pragma once
#include <courier/schema/cancel_authorization.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/receive_with_authorization.hpp>
#include <courier/schema/token_transfer.hpp>
#include <courier/schema/transfer_with_authorization.hpp>
#include <variant>

namespace courier::schema {

using transaction_payload_t = std::variant<transfer_with_authorization_t,
                                           receive_with_authorization_t,
                                           cancel_authorization_t,
                                           token_transfer_t>;

template <uint16_t Version>
struct transaction;

/// Signed submission envelope.
///
/// `signer` is the submitting account. It is authenticated by recovering
/// `signature` over the envelope digest, and `nonce` is the signer's next
/// envelope sequence number, starting at 1. The recovered signer is the
/// caller for payee-gated and plain ledger transfers.
template <>
struct transaction<1> final {
  uint16_t version{1};
  uint256_t chain_id{};
  uint64_t nonce{};
  address_t signer{};
  transaction_payload_t payload{};
  secp256k1_signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace courier::schema
