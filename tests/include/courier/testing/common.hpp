#pragma once

#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::testing {

using scale_encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;

inline courier::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = courier::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline courier::schema::address_t make_address(const uint8_t seed) {
  auto out = courier::schema::address_t{};
  out.fill(seed);
  return out;
}

/// secp256k1 scalar with `value` in the lowest byte.
inline courier::schema::hash32_t make_private_key(const uint8_t value) {
  auto key = courier::schema::hash32_t{};
  key[31] = value;
  return key;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace courier::testing
