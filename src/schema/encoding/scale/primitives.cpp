#include <courier/schema/encoding/scale/primitives.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(secp256k1_signature_t&& o, ::scale::Encoder& encoder) {
  encode(o.v, encoder);
  encode(o.r, encoder);
  encode(o.s, encoder);
}

void decode(secp256k1_signature_t&& o, ::scale::Decoder& decoder) {
  decode(o.v, decoder);
  decode(o.r, decoder);
  decode(o.s, decoder);
}

}  // namespace courier::schema::encoding::scale
