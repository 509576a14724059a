#include <array>
#include <courier/eip712/abi.hpp>
#include <courier/eip712/struct_hash.hpp>
#include <courier/keccak/hash.hpp>

using namespace courier::schema;

namespace courier::eip712 {

namespace {

// Transfer and receive share the field layout and differ only in typehash.
template <typename Message>
hash32_t payment_struct_hash(const hash32_t& typehash, const Message& message) {
  auto fields = std::array<field_t, 6>{
      message.from,         message.to,           message.value,
      message.valid_after, message.valid_before, message.nonce};
  return struct_hash(typehash, fields);
}

}  // namespace

hash32_t transfer_with_authorization_typehash() {
  static const auto typehash =
      courier::keccak::hash(kTransferWithAuthorizationType);
  return typehash;
}

hash32_t receive_with_authorization_typehash() {
  static const auto typehash =
      courier::keccak::hash(kReceiveWithAuthorizationType);
  return typehash;
}

hash32_t cancel_authorization_typehash() {
  static const auto typehash = courier::keccak::hash(kCancelAuthorizationType);
  return typehash;
}

hash32_t struct_hash(const hash32_t& typehash,
                     std::span<const field_t> fields) {
  auto encoded = bytes_t{};
  encoded.reserve((fields.size() + 1) * 32);
  abi::append_word(encoded, typehash);
  for (const auto& field : fields) {
    std::visit([&](const auto& value) { abi::append_word(encoded, value); },
               field);
  }
  return courier::keccak::hash(bytes_view_t{encoded});
}

hash32_t struct_hash(const transfer_with_authorization_t& message) {
  return payment_struct_hash(transfer_with_authorization_typehash(), message);
}

hash32_t struct_hash(const receive_with_authorization_t& message) {
  return payment_struct_hash(receive_with_authorization_typehash(), message);
}

hash32_t struct_hash(const cancel_authorization_t& message) {
  auto fields = std::array<field_t, 2>{message.authorizer, message.nonce};
  return struct_hash(cancel_authorization_typehash(), fields);
}

}  // namespace courier::eip712
