#pragma once
#include <lockbox/schema/set_paused.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const set_paused<1>& o, ::scale::Encoder& encoder);
void decode(set_paused<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
