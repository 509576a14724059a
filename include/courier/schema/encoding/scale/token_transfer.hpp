#pragma once
#include <courier/schema/token_transfer.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace courier::schema::encoding::scale {

void encode(token_transfer<1>&& o, ::scale::Encoder& encoder);
void decode(token_transfer<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
