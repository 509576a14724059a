#include <courier/common/critical.hpp>
#include <courier/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace courier::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{"0x"};
  out.reserve(2 + bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHex[(value >> 4u) & 0x0Fu]);
    out.push_back(kHex[value & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::string to_hex(const address_t& address) {
  return to_hex(bytes_view_t{address.data(), address.size()});
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    courier::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    compact.push_back(ch);
  }

  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto decode_char = [](const char ch) -> std::optional<uint32_t> {
    if (ch >= 'A' && ch <= 'Z') {
      return static_cast<uint32_t>(ch - 'A');
    }
    if (ch >= 'a' && ch <= 'z') {
      return static_cast<uint32_t>(ch - 'a' + 26);
    }
    if (ch >= '0' && ch <= '9') {
      return static_cast<uint32_t>(ch - '0' + 52);
    }
    if (ch == '+') {
      return uint32_t{62};
    }
    if (ch == '/') {
      return uint32_t{63};
    }
    return std::nullopt;
  };

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);

  for (size_t i = 0; i < compact.size(); i += 4) {
    const auto is_last_chunk = (i + 4) == compact.size();
    auto padding = size_t{0};
    auto value = uint32_t{0};
    for (size_t j = 0; j < 4; ++j) {
      const auto ch = compact[i + j];
      if (ch == '=') {
        // Padding only in the last two positions of the final chunk.
        if (!is_last_chunk || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      if (padding != 0) {
        return std::nullopt;
      }
      auto decoded = decode_char(ch);
      if (!decoded) {
        return std::nullopt;
      }
      value = (value << 6u) | *decoded;
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }

  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    courier::common::critical("invalid base64 input");
  }
  return *decoded;
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    courier::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view hex) {
  auto hash = try_make_fixed<32>(hex);
  if (!hash) {
    courier::common::critical("make_hash32 expected 32 bytes of hex");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

address_t make_address(const std::string_view hex) {
  auto address = try_make_fixed<20>(hex);
  if (!address) {
    courier::common::critical("make_address expected 20 bytes of hex");
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view hex) {
  return try_make_fixed<20>(hex);
}

address_t make_zero_address() {
  return {};
}

bool is_zero(const address_t& address) {
  return std::ranges::all_of(address, [](const uint8_t b) { return b == 0; });
}

uint256_t to_uint256(const hash32_t& word) {
  auto value = uint256_t{};
  boost::multiprecision::import_bits(value, word.begin(), word.end(), 8, true);
  return value;
}

hash32_t to_word(const uint256_t& value) {
  auto exported = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(exported), 8,
                                     true);
  auto word = hash32_t{};
  const auto count = std::min(exported.size(), word.size());
  std::copy(exported.end() - static_cast<std::ptrdiff_t>(count),
            exported.end(), word.end() - static_cast<std::ptrdiff_t>(count));
  return word;
}

std::optional<uint256_t> try_parse_uint256(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  if (text == "max") {
    return std::numeric_limits<uint256_t>::max();
  }
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    if (text.size() > 64) {
      return std::nullopt;
    }
    auto padded = std::string(64 - text.size(), '0');
    padded.append(text);
    auto word = try_make_hash32(padded);
    if (!word) {
      return std::nullopt;
    }
    return to_uint256(*word);
  }

  // Accumulate in an unbounded integer so overflow is detectable.
  auto value = boost::multiprecision::cpp_int{};
  for (const auto ch : text) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = value * 10 + (ch - '0');
    if (value > boost::multiprecision::cpp_int{
                    std::numeric_limits<uint256_t>::max()}) {
      return std::nullopt;
    }
  }
  return static_cast<uint256_t>(value);
}

std::array<uint8_t, 65> pack_signature(const secp256k1_signature_t& signature) {
  auto packed = std::array<uint8_t, 65>{};
  std::copy(signature.r.begin(), signature.r.end(), packed.begin());
  std::copy(signature.s.begin(), signature.s.end(), packed.begin() + 32);
  packed[64] = signature.v;
  return packed;
}

secp256k1_signature_t unpack_signature(const std::array<uint8_t, 65>& packed) {
  auto signature = secp256k1_signature_t{};
  std::copy_n(packed.begin(), 32, signature.r.begin());
  std::copy_n(packed.begin() + 32, 32, signature.s.begin());
  signature.v = packed[64];
  return signature;
}

std::optional<secp256k1_signature_t> try_unpack_signature(
    const bytes_view_t& packed) {
  if (packed.size() != 65) {
    return std::nullopt;
  }
  auto fixed = std::array<uint8_t, 65>{};
  std::copy(packed.begin(), packed.end(), fixed.begin());
  return unpack_signature(fixed);
}

}  // namespace courier::schema
