#pragma once
#include <lockbox/schema/custom_fee.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const custom_fee<1>& o, ::scale::Encoder& encoder);
void decode(custom_fee<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
