#include <gtest/gtest.h>
#include <lockbox/blake3/hash.hpp>
#include <lockbox/schema/account.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/schema/signing.hpp>
#include <lockbox/schema/transaction.hpp>
#include <lockbox/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef LOCKBOX_TRANSACTION_BUILDER_PATH
#define LOCKBOX_TRANSACTION_BUILDER_PATH ""
#endif

using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

using encoder_t =
    lockbox::schema::encoding::encoder<lockbox::schema::encoding::scale_encoder_tag>;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_builder(const std::string_view args) {
  auto command = shell_quote(LOCKBOX_TRANSACTION_BUILDER_PATH) + " " +
                 std::string{args} + " 2>/dev/null";
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), trim(output)};
}

std::string expect_output(const std::string& args) {
  auto [exit_code, output] = run_builder(args);
  EXPECT_EQ(exit_code, 0) << "lockbox_tx " << args << '\n' << output;
  return output;
}

bool builder_available() {
  const auto path = std::string{LOCKBOX_TRANSACTION_BUILDER_PATH};
  return !path.empty() && std::filesystem::exists(path);
}

std::string signer_hex(const ed25519_signer_id& signer) {
  return to_hex(bytes_view_t{signer.public_key});
}

}  // namespace

TEST(transaction_builder, chain_id_hashes_names_and_passes_raw_ids) {
  if (!builder_available()) {
    GTEST_SKIP() << "lockbox_tx not available";
  }
  EXPECT_EQ(expect_output("chain-id"),
            to_hex(lockbox::blake3::hash(std::string_view{"lockbox-local"})));

  const auto raw = to_hex(make_hash(0x42));
  EXPECT_EQ(expect_output("chain-id --chain-id " + raw), raw);
}

TEST(transaction_builder, account_id_derives_from_signer) {
  if (!builder_available()) {
    GTEST_SKIP() << "lockbox_tx not available";
  }
  const auto signer = make_ed25519_signer(3);
  EXPECT_EQ(expect_output("account-id --signer " + signer_hex(signer)),
            to_string(make_account_id(signer_id_t{signer})));
}

TEST(transaction_builder, create_lock_transaction_decodes_to_requested_fields) {
  if (!builder_available()) {
    GTEST_SKIP() << "lockbox_tx not available";
  }
  const auto signer = make_ed25519_signer(5);
  const auto asset = make_asset_type(0x70);
  const auto beneficiary = make_account(0x20);
  const auto args = "transaction --payload create_lock --chain-id lockbox-test"
                    " --nonce 7 --signer " +
                    signer_hex(signer) + " --asset-type " + to_string(asset) +
                    " --serial 12 --beneficiary " + to_string(beneficiary) +
                    " --duration 3600";

  auto bytes = try_from_base64(expect_output(args));
  ASSERT_TRUE(bytes.has_value());
  auto tx = encoder_t{}.decode<transaction_t>(make_bytes_view(bytes.value()));

  EXPECT_EQ(tx.version, 1u);
  EXPECT_EQ(tx.nonce, 7u);
  EXPECT_EQ(tx.chain_id,
            lockbox::blake3::hash(std::string_view{"lockbox-test"}));
  ASSERT_TRUE(std::holds_alternative<ed25519_signer_id>(tx.signer));
  EXPECT_EQ(std::get<ed25519_signer_id>(tx.signer).public_key,
            signer.public_key);
  ASSERT_TRUE(std::holds_alternative<create_lock_t>(tx.payload));
  const auto& create = std::get<create_lock_t>(tx.payload);
  EXPECT_EQ(create.asset_type, asset);
  EXPECT_EQ(create.serial_number, serial_number_t{12});
  EXPECT_EQ(create.beneficiary, beneficiary);
  EXPECT_EQ(create.duration, 3600u);
  EXPECT_EQ(std::get<ed25519_signature_t>(tx.signature),
            ed25519_signature_t{});
}

TEST(transaction_builder, fee_schedule_transaction_carries_amounts) {
  if (!builder_available()) {
    GTEST_SKIP() << "lockbox_tx not available";
  }
  const auto signer = make_ed25519_signer(6);
  const auto collector = make_account(0x50);
  const auto exempt = make_account(0x11);
  const auto args = "transaction --payload update_fee_schedule --signer " +
                    signer_hex(signer) +
                    " --creation-fee 340282366920938463463374607431768211456"
                    " --extension-fee 25 --collector " +
                    to_string(collector) + " --exempt " + to_string(exempt);

  auto bytes = try_from_base64(expect_output(args));
  ASSERT_TRUE(bytes.has_value());
  auto tx = encoder_t{}.decode<transaction_t>(make_bytes_view(bytes.value()));
  ASSERT_TRUE(std::holds_alternative<update_fee_schedule_t>(tx.payload));
  const auto& schedule = std::get<update_fee_schedule_t>(tx.payload).schedule;
  EXPECT_EQ(schedule.creation_fee, amount_t{1} << 128);
  EXPECT_EQ(schedule.extension_fee, amount_t{25});
  EXPECT_EQ(schedule.collector, collector);
  ASSERT_EQ(schedule.exempt_accounts.size(), 1u);
  EXPECT_EQ(schedule.exempt_accounts.front(), exempt);
}

TEST(transaction_builder, signing_bytes_match_library_form) {
  if (!builder_available()) {
    GTEST_SKIP() << "lockbox_tx not available";
  }
  const auto signer = make_ed25519_signer(9);
  const auto asset = make_asset_type(0x71);
  const auto common_args = "--payload withdraw_unlocked_asset --nonce 3"
                           " --signer " +
                           signer_hex(signer) + " --asset-type " +
                           to_string(asset) + " --serial 4";

  auto bytes = try_from_base64(expect_output("transaction " + common_args));
  ASSERT_TRUE(bytes.has_value());
  auto encoder = encoder_t{};
  auto tx = encoder.decode<transaction_t>(make_bytes_view(bytes.value()));

  EXPECT_EQ(expect_output("signing-bytes " + common_args),
            to_hex(make_signing_bytes(encoder, tx)));
}

TEST(transaction_builder, query_keys_follow_route_encoding) {
  if (!builder_available()) {
    GTEST_SKIP() << "lockbox_tx not available";
  }
  auto encoder = encoder_t{};
  const auto asset = make_asset_type(0x72);
  const auto account = make_account(0x21);

  EXPECT_EQ(expect_output("query-key --path /state/lock --asset-type " +
                          to_string(asset) + " --serial 5"),
            to_base64(encoder.encode(std::tuple{asset, serial_number_t{5}})));
  EXPECT_EQ(expect_output("query-key --path /state/association --asset-type " +
                          to_string(asset)),
            to_base64(encoder.encode(asset)));
  EXPECT_EQ(expect_output("query-key --path /state/nonce --account " +
                          to_string(account)),
            to_base64(encoder.encode(account)));
  EXPECT_EQ(expect_output("query-key --path /state/governance"), "");
}

TEST(transaction_builder, rejects_unknown_commands_and_bad_input) {
  if (!builder_available()) {
    GTEST_SKIP() << "lockbox_tx not available";
  }
  EXPECT_NE(run_builder("decode-everything").first, 0);
  EXPECT_NE(run_builder("transaction --payload transfer_everything --signer " +
                        signer_hex(make_ed25519_signer(1)))
                .first,
            0);
  EXPECT_NE(run_builder("account-id --signer zz").first, 0);
  EXPECT_NE(run_builder("transaction --payload set_paused --nonce -1").first,
            0);
}
