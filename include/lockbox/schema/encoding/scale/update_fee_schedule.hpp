#pragma once
#include <lockbox/schema/update_fee_schedule.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const update_fee_schedule<1>& o, ::scale::Encoder& encoder);
void decode(update_fee_schedule<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
