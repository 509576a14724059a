#pragma once
#include <courier/schema/primitives.hpp>

// Schema type: token transfer.
// Plain ledger transfer from the submitting caller's own balance.
namespace courier::schema {

template <uint16_t Version>
struct token_transfer;

template <>
struct token_transfer<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t value{};
};

using token_transfer_t = token_transfer<1>;

}  // namespace courier::schema
