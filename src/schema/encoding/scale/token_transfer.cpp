#include <courier/schema/encoding/scale/token_transfer.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(token_transfer<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.to, encoder);
  encode(o.value, encoder);
}

void decode(token_transfer<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.to, decoder);
  decode(o.value, decoder);
}

}  // namespace courier::schema::encoding::scale
