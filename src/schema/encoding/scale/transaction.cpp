#include <courier/schema/encoding/scale/cancel_authorization.hpp>
#include <courier/schema/encoding/scale/primitives.hpp>
#include <courier/schema/encoding/scale/receive_with_authorization.hpp>
#include <courier/schema/encoding/scale/token_transfer.hpp>
#include <courier/schema/encoding/scale/transaction.hpp>
#include <courier/schema/encoding/scale/transfer_with_authorization.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace courier::schema::encoding::scale
