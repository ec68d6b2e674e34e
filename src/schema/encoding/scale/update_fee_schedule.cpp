#include <lockbox/schema/encoding/scale/fee_schedule.hpp>
#include <lockbox/schema/encoding/scale/update_fee_schedule.hpp>

namespace lockbox::schema {

void encode(const update_fee_schedule<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.schedule, encoder);
}

void decode(update_fee_schedule<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.schedule, decoder);
}

}  // namespace lockbox::schema
