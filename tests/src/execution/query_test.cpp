#include <gtest/gtest.h>
#include <lockbox/schema/query_error_code.hpp>
#include <lockbox/testing/execution_harness.hpp>

#include <tuple>
#include <vector>

using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

uint32_t code_of(const query_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace

TEST(engine_query, lock_route_returns_record_or_not_found) {
  auto harness = execution_harness{"lockbox_query_lock"};
  harness.prepare_unit(kNft, 3);
  harness.now = 42;
  ASSERT_TRUE(harness.create(kNft, 3, 600).ok());

  auto key = harness.encoder.encode(std::tuple{kNft, serial_number_t{3}});
  auto found = harness.engine->query("/state/lock", key);
  ASSERT_EQ(found.code, 0u) << found.info;
  EXPECT_EQ(found.key, key);
  EXPECT_EQ(found.codespace, "lockbox.query");
  EXPECT_EQ(found.sequence, harness.engine->info().last_sequence);
  auto record = harness.encoder.decode<lock_record_t>(found.value);
  EXPECT_EQ(record.start, 42u);
  EXPECT_EQ(record.duration, 600u);

  auto other = harness.encoder.encode(std::tuple{kNft, serial_number_t{4}});
  EXPECT_EQ(harness.engine->query("/state/lock", other).code,
            code_of(query_error_code::not_found));
  EXPECT_EQ(harness.engine->query("/state/lock", bytes_t{0x01}).code,
            code_of(query_error_code::invalid_key));
}

TEST(engine_query, listing_and_configuration_routes) {
  auto harness = execution_harness{"lockbox_query_listing"};
  harness.prepare_unit(kNft, 1);
  harness.prepare_unit(kNft, 2);
  ASSERT_TRUE(harness.create(kNft, 1, 600).ok());
  ASSERT_TRUE(harness.create(kNft, 2, 900).ok());
  ASSERT_TRUE(harness.set_fees(11, 4, {kStranger}).ok());

  auto locks = harness.engine->query("/state/locks", {});
  ASSERT_EQ(locks.code, 0u);
  EXPECT_EQ(harness.encoder.decode<std::vector<lock_record_t>>(locks.value)
                .size(),
            2u);

  auto fees = harness.engine->query("/state/fee_schedule", {});
  ASSERT_EQ(fees.code, 0u);
  auto schedule = harness.encoder.decode<fee_schedule_t>(fees.value);
  EXPECT_EQ(schedule.creation_fee, amount_t{11});
  EXPECT_EQ(schedule.extension_fee, amount_t{4});
  EXPECT_EQ(schedule.collector, kCollector);
  ASSERT_EQ(schedule.exempt_accounts.size(), 1u);
  EXPECT_EQ(schedule.exempt_accounts.front(), kStranger);

  auto governance = harness.engine->query("/state/governance", {});
  ASSERT_EQ(governance.code, 0u);
  auto state = harness.encoder.decode<governance_state_t>(governance.value);
  EXPECT_EQ(state.administrator, kAdmin);
  EXPECT_FALSE(state.paused);

  auto association = harness.engine->query("/state/association",
                                           harness.encoder.encode(kNft));
  ASSERT_EQ(association.code, 0u);
  EXPECT_TRUE(harness.encoder.decode<bool>(association.value));

  auto nonce = harness.engine->query("/state/nonce",
                                     harness.encoder.encode(kCreator));
  ASSERT_EQ(nonce.code, 0u);
  EXPECT_EQ(harness.encoder.decode<uint64_t>(nonce.value), 1u);

  auto info = harness.engine->query("/engine/info", {});
  ASSERT_EQ(info.code, 0u);
  auto decoded = harness.encoder.decode<app_info_t>(info.value);
  EXPECT_EQ(decoded.last_sequence, harness.engine->info().last_sequence);
  EXPECT_EQ(decoded.state_root, harness.engine->info().state_root);
}

TEST(engine_query, unknown_route_and_bad_keys_are_reported) {
  auto harness = execution_harness{"lockbox_query_errors"};
  auto unknown = harness.engine->query("/state/unknown", {});
  EXPECT_EQ(unknown.code, code_of(query_error_code::unsupported_path));
  EXPECT_EQ(unknown.log, "unsupported_path");
  EXPECT_EQ(unknown.info, "/state/unknown");
  EXPECT_EQ(unknown.codespace, "lockbox.query");

  EXPECT_EQ(harness.engine->query("/state/nonce", {}).code,
            code_of(query_error_code::invalid_key));
  EXPECT_EQ(harness.engine->query("/state/association", bytes_t{0x02}).code,
            code_of(query_error_code::invalid_key));
}
