#pragma once
#include <courier/schema/primitives.hpp>
#include <string_view>

// ABI static word encoding used inside EIP-712 struct hashes. Every value
// occupies exactly one 32-byte word.
namespace courier::eip712::abi {

courier::schema::hash32_t encode_word(const courier::schema::address_t& value);
courier::schema::hash32_t encode_word(const courier::schema::uint256_t& value);
courier::schema::hash32_t encode_word(const courier::schema::hash32_t& value);

/// Dynamic `string` members are hashed before encoding.
courier::schema::hash32_t encode_string(const std::string_view& value);

template <typename T>
void append_word(courier::schema::bytes_t& out, const T& value) {
  auto word = encode_word(value);
  out.insert(std::end(out), std::begin(word), std::end(word));
}

}  // namespace courier::eip712::abi
