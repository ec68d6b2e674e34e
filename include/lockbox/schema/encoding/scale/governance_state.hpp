#pragma once
#include <lockbox/schema/governance_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const governance_state<1>& o, ::scale::Encoder& encoder);
void decode(governance_state<1>& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
