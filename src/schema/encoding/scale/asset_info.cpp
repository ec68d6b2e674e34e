#include <lockbox/schema/encoding/scale/asset_info.hpp>
#include <lockbox/schema/encoding/scale/custom_fee.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const asset_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_type, encoder);
  encode(o.kind, encoder);
  encode(o.custom_fees, encoder);
}

void decode(asset_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_type, decoder);
  decode(o.kind, decoder);
  decode(o.custom_fees, decoder);
}

}  // namespace lockbox::schema
