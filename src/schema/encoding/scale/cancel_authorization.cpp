#include <courier/schema/encoding/scale/cancel_authorization.hpp>
#include <courier/schema/encoding/scale/primitives.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(cancel_authorization<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.authorizer, encoder);
  encode(o.nonce, encoder);
  encode(o.signature, encoder);
}

void decode(cancel_authorization<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.authorizer, decoder);
  decode(o.nonce, decoder);
  decode(o.signature, decoder);
}

}  // namespace courier::schema::encoding::scale
