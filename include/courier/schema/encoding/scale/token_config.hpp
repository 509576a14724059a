#pragma once
#include <courier/schema/token_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace courier::schema::encoding::scale {

void encode(token_config<1>&& o, ::scale::Encoder& encoder);
void decode(token_config<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
