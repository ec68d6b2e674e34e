#include <boost/program_options.hpp>
#include <lockbox/blake3/hash.hpp>
#include <lockbox/common/critical.hpp>
#include <lockbox/schema/account.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/schema/signing.hpp>
#include <lockbox/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = lockbox::schema::encoding::encoder<
    lockbox::schema::encoding::scale_encoder_tag>;

namespace po = boost::program_options;
using namespace lockbox::schema;

const std::string& require(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    lockbox::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

account_id_t get_account(const po::variables_map& vm,
                         const std::string& name) {
  auto account = try_make_account(require(vm, name));
  if (!account) {
    lockbox::common::critical("--{} must be a 32-byte hex account", name);
  }
  return account.value();
}

asset_type_id_t get_asset_type(const po::variables_map& vm) {
  auto asset_type = try_make_asset_type(require(vm, "asset-type"));
  if (!asset_type) {
    lockbox::common::critical("--asset-type must be a 32-byte hex id");
  }
  return asset_type.value();
}

serial_number_t get_serial(const po::variables_map& vm) {
  if (!vm.contains("serial")) {
    lockbox::common::critical("missing required argument --serial");
  }
  return serial_number_t{vm["serial"].as<int64_t>()};
}

amount_t get_amount(const po::variables_map& vm, const std::string& name) {
  const auto& value = vm[name].as<std::string>();
  if (value.empty() || value.size() > 77 ||
      !std::all_of(std::begin(value), std::end(value),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    lockbox::common::critical("--{} must be a non-negative integer", name);
  }
  return amount_t{value};
}

// A chain name is hashed the way the daemon hashes --chain-id; 64 hex digits
// are taken as the hash itself.
hash32_t get_chain_id(const po::variables_map& vm) {
  const auto& value = vm["chain-id"].as<std::string>();
  if (value.size() == 64) {
    if (auto parsed = try_make_hash32(value)) {
      return parsed.value();
    }
  }
  return lockbox::blake3::hash(std::string_view{value});
}

signer_id_t get_signer(const po::variables_map& vm) {
  auto signer = try_make_signer(require(vm, "signer"));
  if (!signer) {
    lockbox::common::critical(
        "--signer must be a 32-byte ed25519 or 33-byte secp256k1 public key");
  }
  return signer.value();
}

// Without --signature-hex the signature is zero-filled in the signer's format.
signature_t make_signature(const po::variables_map& vm,
                           const signer_id_t& signer) {
  auto bytes = bytes_t{};
  const auto& hex = vm["signature-hex"].as<std::string>();
  if (!hex.empty()) {
    auto decoded = try_from_hex(hex);
    if (!decoded) {
      lockbox::common::critical("--signature-hex is not valid hex");
    }
    bytes = std::move(decoded.value());
  }
  return std::visit(
      overloaded{
          [&](const ed25519_signer_id&) {
            auto signature = ed25519_signature_t{};
            if (!bytes.empty()) {
              if (bytes.size() != signature.size()) {
                lockbox::common::critical("ed25519 signature must be 64 bytes");
              }
              std::copy(std::begin(bytes), std::end(bytes),
                        std::begin(signature));
            }
            return signature_t{signature};
          },
          [&](const secp256k1_signer_id&) {
            auto signature = secp256k1_signature_t{};
            if (!bytes.empty()) {
              if (bytes.size() != signature.size()) {
                lockbox::common::critical(
                    "secp256k1 signature must be 65 bytes");
              }
              std::copy(std::begin(bytes), std::end(bytes),
                        std::begin(signature));
            }
            return signature_t{signature};
          }},
      signer);
}

transaction_payload_t build_payload(const po::variables_map& vm) {
  const auto& payload = require(vm, "payload");

  if (payload == "associate_asset") {
    return associate_asset_t{.asset_type = get_asset_type(vm)};
  }
  if (payload == "create_lock") {
    if (!vm.contains("duration")) {
      lockbox::common::critical("create_lock requires --duration");
    }
    return create_lock_t{.asset_type = get_asset_type(vm),
                         .serial_number = get_serial(vm),
                         .beneficiary = get_account(vm, "beneficiary"),
                         .duration = vm["duration"].as<uint64_t>()};
  }
  if (payload == "extend_lock_duration") {
    if (!vm.contains("extra-duration")) {
      lockbox::common::critical(
          "extend_lock_duration requires --extra-duration");
    }
    return extend_lock_duration_t{
        .asset_type = get_asset_type(vm),
        .serial_number = get_serial(vm),
        .extra_duration = vm["extra-duration"].as<uint64_t>()};
  }
  if (payload == "withdraw_unlocked_asset") {
    return withdraw_unlocked_asset_t{.asset_type = get_asset_type(vm),
                                     .serial_number = get_serial(vm)};
  }
  if (payload == "set_paused") {
    return set_paused_t{.paused = vm["paused"].as<bool>()};
  }
  if (payload == "update_fee_schedule") {
    auto schedule = fee_schedule_t{};
    schedule.creation_fee = get_amount(vm, "creation-fee");
    schedule.extension_fee = get_amount(vm, "extension-fee");
    if (vm.contains("collector")) {
      schedule.collector = get_account(vm, "collector");
    }
    if (vm.contains("exempt")) {
      for (const auto& value : vm["exempt"].as<std::vector<std::string>>()) {
        auto account = try_make_account(value);
        if (!account) {
          lockbox::common::critical("invalid --exempt account '{}'", value);
        }
        schedule.exempt_accounts.push_back(account.value());
      }
    }
    return update_fee_schedule_t{.schedule = std::move(schedule)};
  }
  if (payload == "set_administrator") {
    return set_administrator_t{.administrator =
                                   get_account(vm, "administrator")};
  }
  lockbox::common::critical("unsupported payload '{}'", payload);
}

transaction_t build_transaction(const po::variables_map& vm) {
  auto signer = get_signer(vm);
  auto signature = make_signature(vm, signer);
  return transaction_t{.version = 1,
                       .chain_id = get_chain_id(vm),
                       .nonce = vm["nonce"].as<uint64_t>(),
                       .signer = std::move(signer),
                       .payload = build_payload(vm),
                       .signature = std::move(signature)};
}

bytes_t build_query_key(const po::variables_map& vm) {
  const auto& path = require(vm, "path");
  auto encoder = encoder_t{};

  if (path == "/engine/info" || path == "/state/locks" ||
      path == "/state/fee_schedule" || path == "/state/governance") {
    return {};
  }
  if (path == "/state/lock") {
    return encoder.encode(std::tuple{get_asset_type(vm), get_serial(vm)});
  }
  if (path == "/state/association") {
    return encoder.encode(get_asset_type(vm));
  }
  if (path == "/state/nonce") {
    return encoder.encode(get_account(vm, "account"));
  }
  lockbox::common::critical("unsupported query path '{}'", path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  lockbox_tx transaction [options]\n"
            << "  lockbox_tx signing-bytes [options]\n"
            << "  lockbox_tx query-key --path <route> [options]\n"
            << "  lockbox_tx account-id --signer <public key hex>\n"
            << "  lockbox_tx chain-id [--chain-id <name>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"lockbox_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-bytes|query-key|account-id|chain-id")(
      "payload", po::value<std::string>(),
      "associate_asset|create_lock|extend_lock_duration|"
      "withdraw_unlocked_asset|set_paused|update_fee_schedule|"
      "set_administrator")("path", po::value<std::string>(), "query route")(
      "chain-id", po::value<std::string>()->default_value("lockbox-local"),
      "chain name or 32-byte chain id hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "request nonce")(
      "signer", po::value<std::string>(),
      "signer public key hex (32-byte ed25519 or 33-byte secp256k1)")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "signature bytes hex")("asset-type", po::value<std::string>(),
                             "collection id hex")(
      "serial", po::value<int64_t>(), "unit serial number")(
      "beneficiary", po::value<std::string>(), "beneficiary account hex")(
      "duration", po::value<uint64_t>(), "lock duration seconds")(
      "extra-duration", po::value<uint64_t>(), "extension seconds")(
      "paused", po::value<bool>()->default_value(true), "pause flag")(
      "creation-fee", po::value<std::string>()->default_value("0"),
      "lock creation fee")("extension-fee",
                           po::value<std::string>()->default_value("0"),
                           "lock extension fee")(
      "collector", po::value<std::string>(), "fee collector account hex")(
      "exempt", po::value<std::vector<std::string>>()->multitoken(),
      "fee-exempt account hex values")(
      "administrator", po::value<std::string>(), "new administrator hex")(
      "account", po::value<std::string>(), "account hex for /state/nonce");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto encoded = encoder_t{}.encode(build_transaction(vm));
    std::cout << to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "signing-bytes") {
    auto encoder = encoder_t{};
    auto bytes = make_signing_bytes(encoder, build_transaction(vm));
    std::cout << to_hex(bytes) << '\n';
    return 0;
  }

  if (command == "query-key") {
    std::cout << to_base64(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "account-id") {
    std::cout << to_string(make_account_id(get_signer(vm))) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << to_hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  lockbox::common::critical(
      "command must be "
      "transaction|signing-bytes|query-key|account-id|chain-id");
}
