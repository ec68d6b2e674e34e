#include <lockbox/schema/encoding/scale/governance_state.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const governance_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.administrator, encoder);
  encode(o.paused, encoder);
}

void decode(governance_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.administrator, decoder);
  decode(o.paused, decoder);
}

}  // namespace lockbox::schema
