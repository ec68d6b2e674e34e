#include <gtest/gtest.h>
#include <lockbox/schema/key/engine_keys.hpp>
#include <lockbox/schema/lock_error_code.hpp>
#include <lockbox/testing/execution_harness.hpp>

#include <optional>
#include <vector>

using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

uint32_t code_of(const lock_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace

TEST(reentrancy, nested_calls_from_transfer_are_rejected) {
  auto harness = execution_harness{"lockbox_reentrancy_create"};
  harness.prepare_unit(kNft, 1);
  harness.prepare_unit(kNft, 2);

  auto nested = std::vector<operation_result_t>{};
  harness.ledger.set_transfer_interceptor(
      [&](const asset_type_id_t&, const serial_number_t&, const account_id_t&,
          const account_id_t&) {
        nested.push_back(harness.create(kNft, 2, 3600));
        nested.push_back(harness.extend(kNft, 1, 10));
        nested.push_back(harness.withdraw(kNft, 1));
        nested.push_back(harness.engine->set_paused(set_paused_t{.paused = true},
                                                    kAdmin));
        nested.push_back(harness.engine->submit_transaction(encode_transaction(
            make_transaction(1, make_ed25519_signer(1),
                             associate_asset_t{.asset_type = kNft}))));
        return true;
      });

  auto outer = harness.create(kNft, 1, 3600);
  ASSERT_TRUE(outer.ok()) << outer.info;
  ASSERT_EQ(nested.size(), 5u);
  for (const auto& result : nested) {
    EXPECT_EQ(result.code, code_of(lock_error_code::reentrancy_rejected));
  }
  EXPECT_FALSE(harness.lock_of(kNft, 2).has_value());
  EXPECT_FALSE(harness.engine->governance().paused);

  harness.ledger.set_transfer_interceptor({});
  EXPECT_TRUE(harness.create(kNft, 2, 3600).ok());
}

TEST(reentrancy, nested_calls_from_fee_charge_are_rejected) {
  auto harness = execution_harness{"lockbox_reentrancy_fee"};
  harness.prepare_unit(kNft, 1);
  ASSERT_TRUE(harness.set_fees(0, 5).ok());
  ASSERT_TRUE(harness.create(kNft, 1, 3600).ok());
  harness.ledger.credit(kBeneficiary, amount_t{5});

  auto nested = std::optional<operation_result_t>{};
  harness.ledger.set_charge_interceptor(
      [&](const account_id_t&, const account_id_t&, const amount_t&) {
        nested = harness.extend(kNft, 1, 1000);
        return true;
      });

  ASSERT_TRUE(harness.extend(kNft, 1, 10).ok());
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->code, code_of(lock_error_code::reentrancy_rejected));
  EXPECT_EQ(harness.lock_of(kNft, 1)->duration, 3610u);
}

TEST(reentrancy, withdrawal_clears_record_before_transfer) {
  auto harness = execution_harness{"lockbox_reentrancy_withdraw"};
  harness.prepare_unit(kNft, 1);
  ASSERT_TRUE(harness.create(kNft, 1, 100).ok());
  harness.now = 100;

  auto observed = std::optional<lock_record_t>{lock_record_t{}};
  auto nested = std::optional<operation_result_t>{};
  harness.ledger.set_transfer_interceptor(
      [&](const asset_type_id_t&, const serial_number_t&, const account_id_t&,
          const account_id_t&) {
        observed = harness.lock_of(kNft, 1);
        nested = harness.withdraw(kNft, 1);
        return true;
      });

  ASSERT_TRUE(harness.withdraw(kNft, 1).ok());
  EXPECT_FALSE(observed.has_value());
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->code, code_of(lock_error_code::reentrancy_rejected));
  EXPECT_EQ(harness.owner_of(kNft, 1), kBeneficiary);
}

TEST(reentrancy, withdrawal_checkpoint_carries_the_deletion) {
  auto harness = execution_harness{"lockbox_reentrancy_checkpoint"};
  harness.prepare_unit(kNft, 1);
  ASSERT_TRUE(harness.create(kNft, 1, 100).ok());
  auto record = harness.lock_of(kNft, 1);
  ASSERT_TRUE(record.has_value());
  const auto sequence = harness.engine->info().last_sequence;
  harness.now = 100;

  // Reinstate the record behind the engine while the release is in flight.
  const auto key =
      key::make_lock_key(harness.encoder, kNft, serial_number_t{1});
  harness.ledger.set_transfer_interceptor(
      [&](const asset_type_id_t&, const serial_number_t&, const account_id_t&,
          const account_id_t&) {
        harness.storage.write({{key, harness.encoder.encode(record.value())}});
        return true;
      });

  ASSERT_TRUE(harness.withdraw(kNft, 1).ok());
  EXPECT_FALSE(harness.lock_of(kNft, 1).has_value());
  EXPECT_EQ(harness.engine->info().last_sequence, sequence + 1);
  EXPECT_EQ(harness.owner_of(kNft, 1), kBeneficiary);
}

TEST(reentrancy, failed_release_restores_the_lock) {
  auto harness = execution_harness{"lockbox_reentrancy_restore"};
  harness.prepare_unit(kNft, 1);
  harness.now = 10;
  ASSERT_TRUE(harness.create(kNft, 1, 100).ok());
  const auto sequence = harness.engine->info().last_sequence;
  harness.now = 500;

  harness.ledger.set_transfer_interceptor(
      [](const asset_type_id_t&, const serial_number_t&, const account_id_t&,
         const account_id_t&) { return false; });

  auto failed = harness.withdraw(kNft, 1);
  EXPECT_EQ(failed.code, code_of(lock_error_code::transfer_failed));
  auto record = harness.lock_of(kNft, 1);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->start, 10u);
  EXPECT_EQ(record->duration, 100u);
  EXPECT_EQ(record->beneficiary, kBeneficiary);
  EXPECT_EQ(harness.owner_of(kNft, 1), kCustody);
  EXPECT_EQ(harness.engine->info().last_sequence, sequence);

  harness.ledger.set_transfer_interceptor({});
  EXPECT_TRUE(harness.withdraw(kNft, 1).ok());
  EXPECT_EQ(harness.owner_of(kNft, 1), kBeneficiary);
}

TEST(reentrancy, unassociated_beneficiary_keeps_lock_in_place) {
  auto harness = execution_harness{"lockbox_reentrancy_unassociated"};
  harness.prepare_unit(kNft, 1);
  ASSERT_TRUE(harness.create(kNft, 1, 100, kCreator, kStranger).ok());
  harness.now = 100;

  EXPECT_EQ(harness.withdraw(kNft, 1).code,
            code_of(lock_error_code::transfer_failed));
  EXPECT_TRUE(harness.lock_of(kNft, 1).has_value());

  ASSERT_TRUE(harness.ledger.associate(kStranger, kNft));
  EXPECT_TRUE(harness.withdraw(kNft, 1).ok());
  EXPECT_EQ(harness.owner_of(kNft, 1), kStranger);
}
