#pragma once
#include <lockbox/schema/extend_lock_duration.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const extend_lock_duration<1>& o, ::scale::Encoder& encoder);
void decode(extend_lock_duration<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
