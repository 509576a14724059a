#pragma once
#include <courier/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace courier::schema::encoding::scale {

void encode(secp256k1_signature_t&& o, ::scale::Encoder& encoder);
void decode(secp256k1_signature_t&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
