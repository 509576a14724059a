#include <courier/schema/encoding/scale/token_config.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(token_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.eip712_version, encoder);
  encode(o.symbol, encoder);
  encode(o.decimals, encoder);
  encode(o.chain_id, encoder);
  encode(o.verifying_contract, encoder);
  encode(o.total_supply, encoder);
  encode(o.initial_holder, encoder);
}

void decode(token_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.eip712_version, decoder);
  decode(o.symbol, decoder);
  decode(o.decimals, decoder);
  decode(o.chain_id, decoder);
  decode(o.verifying_contract, decoder);
  decode(o.total_supply, decoder);
  decode(o.initial_holder, decoder);
}

}  // namespace courier::schema::encoding::scale
