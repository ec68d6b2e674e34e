#include <lockbox/schema/encoding/scale/primitives.hpp>

namespace lockbox::schema {

void encode(const account_id_t& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

void decode(account_id_t& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

void encode(const asset_type_id_t& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

void decode(asset_type_id_t& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

void encode(const serial_number_t& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

void decode(serial_number_t& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace lockbox::schema
