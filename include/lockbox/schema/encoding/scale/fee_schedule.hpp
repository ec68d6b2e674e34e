#pragma once
#include <lockbox/schema/fee_schedule.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const fee_schedule<1>& o, ::scale::Encoder& encoder);
void decode(fee_schedule<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
