#include <lockbox/schema/encoding/scale/extend_lock_duration.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const extend_lock_duration<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_type, encoder);
  encode(o.serial_number, encoder);
  encode(o.extra_duration, encoder);
}

void decode(extend_lock_duration<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_type, decoder);
  decode(o.serial_number, decoder);
  decode(o.extra_duration, decoder);
}

}  // namespace lockbox::schema
