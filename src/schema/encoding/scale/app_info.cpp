#include <lockbox/schema/encoding/scale/app_info.hpp>

namespace lockbox::schema {

void encode(const app_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.schema_version, encoder);
  encode(o.data, encoder);
  encode(o.version, encoder);
  encode(o.app_version, encoder);
  encode(o.last_sequence, encoder);
  encode(o.state_root, encoder);
}

void decode(app_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.schema_version, decoder);
  decode(o.data, decoder);
  decode(o.version, decoder);
  decode(o.app_version, decoder);
  decode(o.last_sequence, decoder);
  decode(o.state_root, decoder);
}

}  // namespace lockbox::schema
