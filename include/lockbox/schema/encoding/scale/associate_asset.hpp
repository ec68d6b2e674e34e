#pragma once
#include <lockbox/schema/associate_asset.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const associate_asset<1>& o, ::scale::Encoder& encoder);
void decode(associate_asset<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
