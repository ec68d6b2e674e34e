#include <lockbox/schema/encoding/scale/set_paused.hpp>

namespace lockbox::schema {

void encode(const set_paused<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.paused, encoder);
}

void decode(set_paused<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.paused, decoder);
}

}  // namespace lockbox::schema
