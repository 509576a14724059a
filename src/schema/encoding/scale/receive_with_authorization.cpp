#include <courier/schema/encoding/scale/primitives.hpp>
#include <courier/schema/encoding/scale/receive_with_authorization.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(receive_with_authorization<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode(o.value, encoder);
  encode(o.valid_after, encoder);
  encode(o.valid_before, encoder);
  encode(o.nonce, encoder);
  encode(o.signature, encoder);
}

void decode(receive_with_authorization<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode(o.value, decoder);
  decode(o.valid_after, decoder);
  decode(o.valid_before, decoder);
  decode(o.nonce, decoder);
  decode(o.signature, decoder);
}

}  // namespace courier::schema::encoding::scale
