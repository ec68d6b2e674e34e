#include <lockbox/schema/encoding/scale/associate_asset.hpp>
#include <lockbox/schema/encoding/scale/create_lock.hpp>
#include <lockbox/schema/encoding/scale/extend_lock_duration.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>
#include <lockbox/schema/encoding/scale/set_administrator.hpp>
#include <lockbox/schema/encoding/scale/set_paused.hpp>
#include <lockbox/schema/encoding/scale/transaction.hpp>
#include <lockbox/schema/encoding/scale/update_fee_schedule.hpp>
#include <lockbox/schema/encoding/scale/withdraw_unlocked_asset.hpp>

namespace lockbox::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace lockbox::schema
