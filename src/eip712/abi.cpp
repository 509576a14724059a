#include <algorithm>
#include <courier/eip712/abi.hpp>
#include <courier/keccak/hash.hpp>

namespace courier::eip712::abi {

courier::schema::hash32_t encode_word(const courier::schema::address_t& value) {
  auto word = courier::schema::make_zero_hash();
  std::copy(std::begin(value), std::end(value),
            std::begin(word) + (word.size() - value.size()));
  return word;
}

courier::schema::hash32_t encode_word(const courier::schema::uint256_t& value) {
  return courier::schema::to_word(value);
}

courier::schema::hash32_t encode_word(const courier::schema::hash32_t& value) {
  return value;
}

courier::schema::hash32_t encode_string(const std::string_view& value) {
  return courier::keccak::hash(value);
}

}  // namespace courier::eip712::abi
