#pragma once
#include <courier/schema/primitives.hpp>
#include <courier/schema/token_config.hpp>
#include <string>
#include <string_view>

namespace courier::eip712 {

inline constexpr std::string_view kDomainType{
    "EIP712Domain(string name,string version,uint256 chainId,address "
    "verifyingContract)"};

/// Inputs of the EIP-712 domain. Immutable once bound.
struct domain_t final {
  std::string name;
  std::string version;
  courier::schema::uint256_t chain_id{};
  courier::schema::address_t verifying_contract{};
};

domain_t make_domain(const courier::schema::token_config_t& config);

courier::schema::hash32_t domain_typehash();

/// keccak(abi.encode(typehash, keccak(name), keccak(version), chainId,
/// verifyingContract)).
courier::schema::hash32_t bind(const domain_t& domain);

}  // namespace courier::eip712
