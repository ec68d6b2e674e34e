#include <lockbox/schema/encoding/scale/create_lock.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const create_lock<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_type, encoder);
  encode(o.serial_number, encoder);
  encode(o.beneficiary, encoder);
  encode(o.duration, encoder);
}

void decode(create_lock<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_type, decoder);
  decode(o.serial_number, decoder);
  decode(o.beneficiary, decoder);
  decode(o.duration, decoder);
}

}  // namespace lockbox::schema
