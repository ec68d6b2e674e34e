#include <lockbox/schema/encoding/scale/lock_record.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const lock_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_type, encoder);
  encode(o.serial_number, encoder);
  encode(o.creator, encoder);
  encode(o.beneficiary, encoder);
  encode(o.start, encoder);
  encode(o.duration, encoder);
}

void decode(lock_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_type, decoder);
  decode(o.serial_number, decoder);
  decode(o.creator, decoder);
  decode(o.beneficiary, decoder);
  decode(o.start, decoder);
  decode(o.duration, decoder);
}

}  // namespace lockbox::schema
