#include <courier/schema/encoding/scale/authorization_status.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(authorization_status_t&& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(authorization_status_t&& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<authorization_status_t>(raw);
}

}  // namespace courier::schema::encoding::scale
