#pragma once

#include <courier/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: authorization status.
// Lifecycle of one (authorizer, nonce) pair. `unused` is the implicit
// default for absent entries; `used` and `canceled` are terminal.
namespace courier::schema {

enum class authorization_status_t : uint8_t {
  unused = 0,
  used = 1,
  canceled = 2,
};

inline constexpr auto kAuthorizationStatusMappings =
    std::array{std::pair<std::string_view, authorization_status_t>{
                   "unused", authorization_status_t::unused},
               std::pair<std::string_view, authorization_status_t>{
                   "used", authorization_status_t::used},
               std::pair<std::string_view, authorization_status_t>{
                   "canceled", authorization_status_t::canceled}};

template <>
inline std::optional<authorization_status_t>
try_from_string<authorization_status_t>(const std::string_view value) {
  return from_string(value, kAuthorizationStatusMappings);
}

inline constexpr std::string_view to_string(
    const authorization_status_t value) {
  return to_string(value, kAuthorizationStatusMappings).value_or("unknown");
}

}  // namespace courier::schema
