#include <lockbox/schema/encoding/scale/associate_asset.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const associate_asset<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_type, encoder);
}

void decode(associate_asset<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_type, decoder);
}

}  // namespace lockbox::schema
