#include <lockbox/schema/encoding/scale/primitives.hpp>
#include <lockbox/schema/encoding/scale/set_administrator.hpp>

namespace lockbox::schema {

void encode(const set_administrator<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.administrator, encoder);
}

void decode(set_administrator<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.administrator, decoder);
}

}  // namespace lockbox::schema
