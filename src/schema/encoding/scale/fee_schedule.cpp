#include <lockbox/schema/encoding/scale/fee_schedule.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

// Fees travel as fixed 32-byte little-endian words.
void encode(const fee_schedule<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(to_amount_bytes(o.creation_fee), encoder);
  encode(to_amount_bytes(o.extension_fee), encoder);
  encode(o.collector, encoder);
  encode(o.exempt_accounts, encoder);
}

void decode(fee_schedule<1>& o, ::scale::Decoder& decoder) {
  auto creation_fee = amount_bytes_t{};
  auto extension_fee = amount_bytes_t{};
  decode(o.version, decoder);
  decode(creation_fee, decoder);
  decode(extension_fee, decoder);
  decode(o.collector, decoder);
  decode(o.exempt_accounts, decoder);
  o.creation_fee = from_amount_bytes(creation_fee);
  o.extension_fee = from_amount_bytes(extension_fee);
}

}  // namespace lockbox::schema
