#pragma once
#include <lockbox/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lockbox::schema {

void encode(const account_id_t& o, ::scale::Encoder& encoder);
void decode(account_id_t& o, ::scale::Decoder& decoder);

void encode(const asset_type_id_t& o, ::scale::Encoder& encoder);
void decode(asset_type_id_t& o, ::scale::Decoder& decoder);

void encode(const serial_number_t& o, ::scale::Encoder& encoder);
void decode(serial_number_t& o, ::scale::Decoder& decoder);

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id& o, ::scale::Decoder& decoder);

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder);

}  // namespace lockbox::schema
