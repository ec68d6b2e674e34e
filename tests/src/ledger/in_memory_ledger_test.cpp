#include <gtest/gtest.h>
#include <lockbox/ledger/in_memory_ledger.hpp>
#include <lockbox/testing/common.hpp>

using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

const auto kAsset = make_asset_type(0x01);
const auto kAlice = make_account(0x10);
const auto kBob = make_account(0x20);

}  // namespace

TEST(in_memory_ledger, mint_associates_owner_and_rejects_duplicates) {
  auto ledger = lockbox::ledger::in_memory_ledger{};
  EXPECT_TRUE(ledger.mint(kAsset, serial_number_t{1}, kAlice));
  EXPECT_FALSE(ledger.mint(kAsset, serial_number_t{1}, kBob));
  EXPECT_EQ(ledger.owner_of(kAsset, serial_number_t{1}), kAlice);
  EXPECT_TRUE(ledger.is_associated(kAlice, kAsset));
  EXPECT_FALSE(ledger.owner_of(kAsset, serial_number_t{2}).has_value());
}

TEST(in_memory_ledger, association_requires_known_collection) {
  auto ledger = lockbox::ledger::in_memory_ledger{};
  EXPECT_FALSE(ledger.associate(kBob, kAsset));
  ledger.set_asset_info(make_nft_info(kAsset));
  EXPECT_TRUE(ledger.associate(kBob, kAsset));
  EXPECT_TRUE(ledger.associate(kBob, kAsset));
  EXPECT_TRUE(ledger.is_associated(kBob, kAsset));

  ledger.remove_asset_info(kAsset);
  EXPECT_FALSE(ledger.asset_info(kAsset).has_value());
}

TEST(in_memory_ledger, transfer_checks_holder_and_association) {
  auto ledger = lockbox::ledger::in_memory_ledger{};
  ledger.set_asset_info(make_nft_info(kAsset));
  ASSERT_TRUE(ledger.mint(kAsset, serial_number_t{1}, kAlice));

  EXPECT_FALSE(ledger.transfer(kAsset, serial_number_t{1}, kAlice, kBob));
  ASSERT_TRUE(ledger.associate(kBob, kAsset));
  EXPECT_FALSE(ledger.transfer(kAsset, serial_number_t{1}, kBob, kAlice));
  EXPECT_FALSE(ledger.transfer(kAsset, serial_number_t{2}, kAlice, kBob));
  EXPECT_TRUE(ledger.transfer(kAsset, serial_number_t{1}, kAlice, kBob));
  EXPECT_EQ(ledger.owner_of(kAsset, serial_number_t{1}), kBob);
}

TEST(in_memory_ledger, charge_moves_balance_to_collector) {
  auto ledger = lockbox::ledger::in_memory_ledger{};
  ledger.credit(kAlice, amount_t{10});
  EXPECT_FALSE(ledger.charge_fee(kAlice, kBob, amount_t{11}));
  EXPECT_EQ(ledger.fee_balance(kAlice), amount_t{10});
  EXPECT_TRUE(ledger.charge_fee(kAlice, kBob, amount_t{4}));
  EXPECT_EQ(ledger.fee_balance(kAlice), amount_t{6});
  EXPECT_EQ(ledger.fee_balance(kBob), amount_t{4});
  EXPECT_FALSE(ledger.charge_fee(kBob, kAlice, amount_t{5}));
}

TEST(in_memory_ledger, interceptors_can_veto_without_changes) {
  auto ledger = lockbox::ledger::in_memory_ledger{};
  ledger.set_asset_info(make_nft_info(kAsset));
  ASSERT_TRUE(ledger.mint(kAsset, serial_number_t{1}, kAlice));
  ASSERT_TRUE(ledger.associate(kBob, kAsset));
  ledger.credit(kAlice, amount_t{10});

  auto transfers = 0;
  ledger.set_transfer_interceptor(
      [&](const asset_type_id_t&, const serial_number_t&, const account_id_t&,
          const account_id_t&) {
        ++transfers;
        return false;
      });
  ledger.set_charge_interceptor(
      [](const account_id_t&, const account_id_t&, const amount_t&) {
        return false;
      });

  EXPECT_FALSE(ledger.transfer(kAsset, serial_number_t{1}, kAlice, kBob));
  EXPECT_EQ(transfers, 1);
  EXPECT_EQ(ledger.owner_of(kAsset, serial_number_t{1}), kAlice);
  EXPECT_FALSE(ledger.charge_fee(kAlice, kBob, amount_t{1}));
  EXPECT_EQ(ledger.fee_balance(kAlice), amount_t{10});
}

TEST(in_memory_ledger, ports_forward_to_ledger) {
  auto ledger = lockbox::ledger::in_memory_ledger{};
  auto ports = ledger.make_ports();
  ledger.set_asset_info(make_nft_info(kAsset));
  ledger.credit(kAlice, amount_t{3});

  EXPECT_TRUE(ports.associate(kBob, kAsset));
  EXPECT_TRUE(ledger.is_associated(kBob, kAsset));
  EXPECT_EQ(ports.fee_balance(kAlice), amount_t{3});
  EXPECT_TRUE(ports.charge_fee(kAlice, kBob, amount_t{3}));
  EXPECT_EQ(ledger.fee_balance(kBob), amount_t{3});
  ASSERT_TRUE(ports.asset_info(kAsset).has_value());
  EXPECT_EQ(ports.asset_info(kAsset)->kind, asset_kind_t::non_fungible_unique);
  ASSERT_TRUE(ledger.mint(kAsset, serial_number_t{5}, kAlice));
  EXPECT_TRUE(ports.transfer(kAsset, serial_number_t{5}, kAlice, kBob));
}
