#pragma once

#include <courier/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace courier::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"courier"};
  std::string version{"0.1.0"};
  std::string token_name;
  std::string token_symbol;
  hash32_t domain_separator{};
};

using app_info_t = app_info<1>;

}  // namespace courier::schema
