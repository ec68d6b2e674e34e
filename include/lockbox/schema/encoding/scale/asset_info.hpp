#pragma once
#include <lockbox/schema/asset_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const asset_info<1>& o, ::scale::Encoder& encoder);
void decode(asset_info<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
