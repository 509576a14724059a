#include <courier/eip712/digest.hpp>
#include <courier/execution/envelope.hpp>
#include <courier/keccak/hash.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>

using namespace courier::schema;

namespace courier::execution {

hash32_t envelope_hash(const transaction_t& tx) {
  auto encoder = courier::schema::encoding::encoder<
      courier::schema::encoding::scale_encoder_tag>{};
  auto unsigned_tx = tx;
  unsigned_tx.signature = secp256k1_signature_t{};
  auto encoded = encoder.encode(unsigned_tx);
  return courier::keccak::hash(make_bytes_view(encoded));
}

hash32_t envelope_digest(const hash32_t& domain_separator,
                         const transaction_t& tx) {
  return courier::eip712::digest(domain_separator, envelope_hash(tx));
}

}  // namespace courier::execution
