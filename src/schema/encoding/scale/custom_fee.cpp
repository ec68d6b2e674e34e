#include <lockbox/schema/encoding/scale/custom_fee.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const custom_fee<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.kind, encoder);
  encode(o.collector, encoder);
  encode(o.numerator, encoder);
  encode(o.denominator, encoder);
  encode(o.fallback_amount, encoder);
}

void decode(custom_fee<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.kind, decoder);
  decode(o.collector, decoder);
  decode(o.numerator, decoder);
  decode(o.denominator, decoder);
  decode(o.fallback_amount, decoder);
}

}  // namespace lockbox::schema
