#pragma once
#include <courier/schema/authorization_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace courier::schema::encoding::scale {

void encode(authorization_status_t&& o, ::scale::Encoder& encoder);
void decode(authorization_status_t&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
