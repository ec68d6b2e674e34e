#include <gtest/gtest.h>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/schema/signing.hpp>
#include <lockbox/schema/transaction.hpp>
#include <lockbox/testing/common.hpp>

#include <vector>

using namespace lockbox::schema;

namespace {

using encoder_t =
    lockbox::schema::encoding::encoder<lockbox::schema::encoding::scale_encoder_tag>;

transaction_t make_tx(transaction_payload_t payload) {
  return transaction_t{
      .version = 1,
      .chain_id = lockbox::testing::make_hash(7),
      .nonce = 3,
      .signer = lockbox::testing::make_ed25519_signer(1),
      .payload = std::move(payload),
      .signature = ed25519_signature_t{}};
}

}  // namespace

TEST(schema_encoding, every_payload_variant_decodes_to_same_alternative) {
  auto schedule = fee_schedule_t{};
  schedule.creation_fee = amount_t{"123456789012345678901234567890"};
  schedule.extension_fee = amount_t{5};
  schedule.collector = lockbox::testing::make_account(9);
  schedule.exempt_accounts = {lockbox::testing::make_account(1),
                              lockbox::testing::make_account(2)};

  auto payloads = std::vector<transaction_payload_t>{
      associate_asset_t{.asset_type = lockbox::testing::make_asset_type(1)},
      create_lock_t{.asset_type = lockbox::testing::make_asset_type(1),
                    .serial_number = serial_number_t{42},
                    .beneficiary = lockbox::testing::make_account(2),
                    .duration = 3600},
      extend_lock_duration_t{.asset_type = lockbox::testing::make_asset_type(1),
                             .serial_number = serial_number_t{42},
                             .extra_duration = 500},
      withdraw_unlocked_asset_t{
          .asset_type = lockbox::testing::make_asset_type(1),
          .serial_number = serial_number_t{42}},
      set_paused_t{.paused = true},
      update_fee_schedule_t{.schedule = schedule},
      set_administrator_t{.administrator = lockbox::testing::make_account(3)}};

  auto encoder = encoder_t{};
  for (const auto& payload : payloads) {
    auto tx = make_tx(payload);
    auto decoded = encoder.try_decode<transaction_t>(encoder.encode(tx));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->payload.index(), payload.index());
    EXPECT_EQ(decoded->nonce, 3u);
    EXPECT_EQ(encoder.encode(decoded.value()), encoder.encode(tx));
  }

  auto update = std::get<update_fee_schedule_t>(
      encoder.decode<transaction_t>(encoder.encode(make_tx(payloads[5])))
          .payload);
  EXPECT_EQ(update.schedule.creation_fee, schedule.creation_fee);
  EXPECT_EQ(update.schedule.exempt_accounts.size(), 2u);
}

TEST(schema_encoding, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_tx(create_lock_t{
      .asset_type = lockbox::testing::make_asset_type(1),
      .serial_number = serial_number_t{1},
      .beneficiary = lockbox::testing::make_account(2),
      .duration = 100}));
  bytes.pop_back();
  EXPECT_FALSE(encoder.try_decode<transaction_t>(bytes).has_value());
  EXPECT_FALSE(encoder.try_decode<lock_record_t>(bytes_t{0x01}).has_value());
}

TEST(schema_encoding, signing_bytes_exclude_signature) {
  auto encoder = encoder_t{};
  auto tx = make_tx(set_paused_t{.paused = true});
  auto unsigned_bytes = make_signing_bytes(encoder, tx);

  auto signed_tx = tx;
  auto signature = ed25519_signature_t{};
  signature.fill(0x5a);
  signed_tx.signature = signature;
  EXPECT_EQ(make_signing_bytes(encoder, signed_tx), unsigned_bytes);

  auto full = encoder.encode(signed_tx);
  ASSERT_GT(full.size(), unsigned_bytes.size());
  EXPECT_TRUE(std::equal(std::begin(unsigned_bytes), std::end(unsigned_bytes),
                         std::begin(full)));

  signed_tx.nonce = 4;
  EXPECT_NE(make_signing_bytes(encoder, signed_tx), unsigned_bytes);
}

TEST(schema_encoding, lock_record_layout_is_fixed_width) {
  auto encoder = encoder_t{};
  auto record = lock_record_t{.asset_type = lockbox::testing::make_asset_type(1),
                              .serial_number = serial_number_t{1},
                              .creator = lockbox::testing::make_account(2),
                              .beneficiary = lockbox::testing::make_account(3),
                              .start = 10,
                              .duration = 20};
  // version + 3 x 32-byte ids + serial + start + duration.
  EXPECT_EQ(encoder.encode(record).size(), 2u + 32u * 3u + 8u * 3u);
  EXPECT_EQ(release_time(record), 30u);

  record.start = UINT64_MAX - 5;
  EXPECT_FALSE(release_time(record).has_value());
}
