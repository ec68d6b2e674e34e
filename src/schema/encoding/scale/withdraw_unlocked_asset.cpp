#include <lockbox/schema/encoding/scale/primitives.hpp>
#include <lockbox/schema/encoding/scale/withdraw_unlocked_asset.hpp>

namespace lockbox::schema {

void encode(const withdraw_unlocked_asset<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_type, encoder);
  encode(o.serial_number, encoder);
}

void decode(withdraw_unlocked_asset<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_type, decoder);
  decode(o.serial_number, decoder);
}

}  // namespace lockbox::schema
