#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace courier::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using nonce_t = hash32_t;
using uint256_t = boost::multiprecision::uint256_t;
using amount_t = uint256_t;
using timestamp_seconds_t = uint64_t;

/// Recoverable secp256k1 signature as submitted by relayers.
///
/// `v` is the recovery id, either raw (0, 1) or Ethereum style (27, 28).
struct secp256k1_signature_t final {
  uint8_t v{};
  hash32_t r{};
  hash32_t s{};
};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);


std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::string to_hex(const address_t& address);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(std::string_view hex);
std::optional<hash32_t> try_make_hash32(std::string_view hex);
hash32_t make_zero_hash();

address_t make_address(std::string_view hex);
std::optional<address_t> try_make_address(std::string_view hex);
address_t make_zero_address();
bool is_zero(const address_t& address);

/// Big-endian 32-byte word <-> 256-bit integer.
uint256_t to_uint256(const hash32_t& word);
hash32_t to_word(const uint256_t& value);
std::optional<uint256_t> try_parse_uint256(std::string_view text);

/// Ethereum signature layout `r || s || v`.
std::array<uint8_t, 65> pack_signature(const secp256k1_signature_t& signature);
secp256k1_signature_t unpack_signature(const std::array<uint8_t, 65>& packed);
std::optional<secp256k1_signature_t> try_unpack_signature(
    const bytes_view_t& packed);

}  // namespace courier::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
