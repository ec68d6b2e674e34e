#pragma once
#include <lockbox/schema/app_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const app_info<1>& o, ::scale::Encoder& encoder);
void decode(app_info<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
