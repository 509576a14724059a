#pragma once
#include <courier/schema/cancel_authorization.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace courier::schema::encoding::scale {

void encode(cancel_authorization<1>&& o, ::scale::Encoder& encoder);
void decode(cancel_authorization<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
