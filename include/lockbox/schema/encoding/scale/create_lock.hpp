#pragma once
#include <lockbox/schema/create_lock.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const create_lock<1>& o, ::scale::Encoder& encoder);
void decode(create_lock<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
