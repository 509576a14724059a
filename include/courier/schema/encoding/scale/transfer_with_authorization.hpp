#pragma once
#include <courier/schema/transfer_with_authorization.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace courier::schema::encoding::scale {

void encode(transfer_with_authorization<1>&& o, ::scale::Encoder& encoder);
void decode(transfer_with_authorization<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
