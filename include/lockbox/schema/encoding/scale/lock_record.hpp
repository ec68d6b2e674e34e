#pragma once
#include <lockbox/schema/lock_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const lock_record<1>& o, ::scale::Encoder& encoder);
void decode(lock_record<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
