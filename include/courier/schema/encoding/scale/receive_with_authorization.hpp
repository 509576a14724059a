#pragma once
#include <courier/schema/receive_with_authorization.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace courier::schema::encoding::scale {

void encode(receive_with_authorization<1>&& o, ::scale::Encoder& encoder);
void decode(receive_with_authorization<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
