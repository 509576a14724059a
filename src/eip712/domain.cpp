#include <courier/eip712/abi.hpp>
#include <courier/eip712/domain.hpp>
#include <courier/keccak/hash.hpp>

namespace courier::eip712 {

domain_t make_domain(const courier::schema::token_config_t& config) {
  return domain_t{.name = config.name,
                  .version = config.eip712_version,
                  .chain_id = config.chain_id,
                  .verifying_contract = config.verifying_contract};
}

courier::schema::hash32_t domain_typehash() {
  static const auto typehash = courier::keccak::hash(kDomainType);
  return typehash;
}

courier::schema::hash32_t bind(const domain_t& domain) {
  auto encoded = courier::schema::bytes_t{};
  encoded.reserve(5 * 32);
  abi::append_word(encoded, domain_typehash());
  abi::append_word(encoded, abi::encode_string(domain.name));
  abi::append_word(encoded, abi::encode_string(domain.version));
  abi::append_word(encoded, domain.chain_id);
  abi::append_word(encoded, domain.verifying_contract);
  return courier::keccak::hash(courier::schema::bytes_view_t{encoded});
}

}  // namespace courier::eip712
