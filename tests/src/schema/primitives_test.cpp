#include <gtest/gtest.h>
#include <lockbox/schema/account.hpp>
#include <lockbox/schema/asset_kind.hpp>
#include <lockbox/schema/lock_error_code.hpp>
#include <lockbox/schema/primitives.hpp>
#include <lockbox/testing/common.hpp>

#include <string>

using namespace lockbox::schema;

TEST(primitives, hex_round_trips_and_accepts_prefix) {
  auto bytes = bytes_t{0x00, 0x1f, 0xa0, 0xff};
  EXPECT_EQ(to_hex(bytes), "001fa0ff");
  EXPECT_EQ(try_from_hex("001FA0FF"), bytes);
  EXPECT_EQ(try_from_hex("0x001fa0ff"), bytes);
  EXPECT_FALSE(try_from_hex("abc").has_value());
  EXPECT_FALSE(try_from_hex("zz").has_value());
}

TEST(primitives, try_make_hash32_requires_32_bytes) {
  auto hex = std::string(64, 'a');
  auto hash = try_make_hash32(hex);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ(hash->front(), 0xaa);
  EXPECT_FALSE(try_make_hash32(std::string(62, 'a')).has_value());
  EXPECT_EQ(make_zero_hash(), hash32_t{});
}

TEST(primitives, base64_round_trips_bytes) {
  auto bytes = bytes_t{'l', 'o', 'c', 'k', 'b', 'o', 'x'};
  auto encoded = to_base64(bytes);
  EXPECT_EQ(encoded, "bG9ja2JveA==");
  EXPECT_EQ(try_from_base64(encoded), bytes);
  EXPECT_EQ(to_base64(bytes_t{}), "");
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(try_from_base64("abc").has_value());
  EXPECT_FALSE(try_from_base64("ab$=").has_value());
}

TEST(primitives, amount_bytes_are_little_endian_and_full_width) {
  auto amount = amount_t{0x0102};
  auto bytes = to_amount_bytes(amount);
  EXPECT_EQ(bytes[0], 0x02);
  EXPECT_EQ(bytes[1], 0x01);
  EXPECT_EQ(bytes[31], 0x00);
  EXPECT_EQ(from_amount_bytes(bytes), amount);

  auto largest = amount_t{~amount_t{0}};
  EXPECT_EQ(from_amount_bytes(to_amount_bytes(largest)), largest);
}

TEST(primitives, identifier_validity_predicates) {
  EXPECT_TRUE(account_id_t{}.is_null());
  EXPECT_FALSE(lockbox::testing::make_account(1).is_null());
  EXPECT_TRUE(asset_type_id_t{}.is_null());
  EXPECT_FALSE(serial_number_t{0}.is_valid());
  EXPECT_FALSE(serial_number_t{-1}.is_valid());
  EXPECT_TRUE(serial_number_t{1}.is_valid());
}

TEST(primitives, account_ids_depend_on_key_type_and_bytes) {
  auto ed = ed25519_signer_id{};
  auto secp = secp256k1_signer_id{};
  EXPECT_NE(make_account_id(ed), make_account_id(secp));
  EXPECT_EQ(make_account_id(ed), make_account_id(ed25519_signer_id{}));

  auto other = ed;
  other.public_key[31] = 1;
  EXPECT_NE(make_account_id(ed), make_account_id(other));
}

TEST(primitives, signer_hex_selects_key_type_by_length) {
  auto ed = try_make_signer(std::string(64, '1'));
  ASSERT_TRUE(ed.has_value());
  EXPECT_TRUE(std::holds_alternative<ed25519_signer_id>(ed.value()));

  auto secp = try_make_signer("02" + std::string(64, '1'));
  ASSERT_TRUE(secp.has_value());
  EXPECT_TRUE(std::holds_alternative<secp256k1_signer_id>(secp.value()));

  EXPECT_FALSE(try_make_signer(std::string(40, '1')).has_value());
  EXPECT_FALSE(try_make_account("nothex").has_value());
  EXPECT_TRUE(try_make_asset_type(std::string(64, 'f')).has_value());
}

TEST(primitives, enum_names_are_stable) {
  EXPECT_EQ(to_string(lock_error_code::reentrancy_rejected),
            "reentrancy_rejected");
  EXPECT_EQ(try_from_string<lock_error_code>("not_yet_expired"),
            lock_error_code::not_yet_expired);
  EXPECT_EQ(to_string(asset_kind_t::non_fungible_unique),
            "non_fungible_unique");
  EXPECT_FALSE(try_from_string<asset_kind_t>("erc20").has_value());
}
