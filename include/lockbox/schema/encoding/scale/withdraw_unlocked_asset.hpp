#pragma once
#include <lockbox/schema/withdraw_unlocked_asset.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const withdraw_unlocked_asset<1>& o, ::scale::Encoder& encoder);
void decode(withdraw_unlocked_asset<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
