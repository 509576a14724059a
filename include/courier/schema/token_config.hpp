#pragma once
#include <courier/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: token config.
// Genesis parameters. The EIP-712 domain (name, eip712_version, chain_id,
// verifying_contract) is derived from this record and never changes once
// persisted.
namespace courier::schema {

template <uint16_t Version>
struct token_config;

template <>
struct token_config<1> final {
  uint16_t version{1};
  std::string name;
  std::string eip712_version{"1"};
  std::string symbol;
  uint8_t decimals{};
  uint256_t chain_id{1};
  address_t verifying_contract{};
  amount_t total_supply{};
  address_t initial_holder{};

  bool operator==(const token_config&) const = default;
};

using token_config_t = token_config<1>;

}  // namespace courier::schema
