#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <lockbox/blake3/hash.hpp>
#include <lockbox/execution/engine.hpp>
#include <lockbox/ledger/in_memory_ledger.hpp>
#include <lockbox/rpc/server.hpp>
#include <lockbox/schema/account.hpp>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
using namespace lockbox::schema;

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

// Decimal only; anything wider than 77 digits cannot fit in 256 bits.
std::optional<amount_t> parse_amount(const std::string& value) {
  if (value.empty() || value.size() > 77 || !std::all_of(std::begin(value), std::end(value),
                                    [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  return amount_t{value};
}

// "<account hex>:<amount>"
bool seed_balance(lockbox::ledger::in_memory_ledger& ledger,
                  const std::string& value) {
  auto split = value.find(':');
  if (split == std::string::npos) {
    return false;
  }
  auto account = try_make_account(std::string_view{value}.substr(0, split));
  auto amount = parse_amount(value.substr(split + 1));
  if (!account || !amount) {
    return false;
  }
  ledger.credit(account.value(), amount.value());
  return true;
}

// "<asset type hex>:<serial>:<owner account hex>"
bool seed_unit(lockbox::ledger::in_memory_ledger& ledger,
               const std::string& value) {
  auto first = value.find(':');
  if (first == std::string::npos) {
    return false;
  }
  auto second = value.find(':', first + 1);
  if (second == std::string::npos) {
    return false;
  }
  auto asset_type = try_make_asset_type(std::string_view{value}.substr(0, first));
  auto owner = try_make_account(std::string_view{value}.substr(second + 1));
  auto serial = int64_t{};
  try {
    serial = std::stoll(value.substr(first + 1, second - first - 1));
  } catch (const std::exception&) {
    return false;
  }
  if (!asset_type || !owner || serial <= 0) {
    return false;
  }
  return ledger.mint(asset_type.value(), serial_number_t{serial},
                     owner.value());
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto chain_name = std::string{};
  auto admin_hex = std::string{};
  auto custody_hex = std::string{};
  auto creation_fee = std::string{};
  auto extension_fee = std::string{};
  auto collector_hex = std::string{};
  auto exempt_hex = std::vector<std::string>{};
  auto min_lock_duration = duration_seconds_t{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto dev_assets = std::vector<std::string>{};
  auto dev_units = std::vector<std::string>{};
  auto dev_balances = std::vector<std::string>{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Lockbox"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26680"),
      "IP:Port for the custody gRPC service")(
      "db-path", po::value<std::string>(&db_path)->default_value("lockbox.db"),
      "RocksDB directory")(
      "chain-id",
      po::value<std::string>(&chain_name)->default_value("lockbox-local"),
      "chain name; requests must carry its BLAKE3 hash")(
      "admin", po::value<std::string>(&admin_hex),
      "initial administrator public key hex (ed25519 or secp256k1)")(
      "custody", po::value<std::string>(&custody_hex),
      "custody account hex")(
      "creation-fee", po::value<std::string>(&creation_fee)->default_value("0"),
      "initial lock creation fee")(
      "extension-fee",
      po::value<std::string>(&extension_fee)->default_value("0"),
      "initial lock extension fee")(
      "fee-collector", po::value<std::string>(&collector_hex),
      "initial fee collector account hex")(
      "fee-exempt", po::value<std::vector<std::string>>(&exempt_hex),
      "fee-exempt account hex (repeatable)")(
      "min-lock-duration",
      po::value<duration_seconds_t>(&min_lock_duration)
          ->default_value(lockbox::execution::kDefaultMinLockDuration),
      "lock durations must exceed this many seconds")(
      "insecure-skip-signatures", "disable request signature verification")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical")(
      "log-file", po::value<std::string>(&log_file)->default_value("lockbox.log"),
      "log file path")(
      "dev-asset", po::value<std::vector<std::string>>(&dev_assets),
      "register an eligible collection in the built-in ledger (repeatable)")(
      "dev-unit", po::value<std::vector<std::string>>(&dev_units),
      "mint asset:serial:owner in the built-in ledger (repeatable)")(
      "dev-balance", po::value<std::vector<std::string>>(&dev_balances),
      "credit account:amount fee tokens in the built-in ledger (repeatable)");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "lockbox", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto config = lockbox::execution::engine_config{};
  config.chain_id = lockbox::blake3::hash(std::string_view{chain_name});
  config.min_lock_duration = min_lock_duration;
  config.require_strict_crypto = !vm.contains("insecure-skip-signatures");

  auto custody = try_make_account(custody_hex);
  if (!custody) {
    spdlog::error("--custody must be a 32-byte hex account");
    spdlog::shutdown();
    return 1;
  }
  config.custody_account = custody.value();

  if (!admin_hex.empty()) {
    auto admin = try_make_signer(admin_hex);
    if (!admin) {
      spdlog::error("--admin must be a 32-byte ed25519 or 33-byte secp256k1 "
                    "public key");
      spdlog::shutdown();
      return 1;
    }
    config.bootstrap_governance.administrator = make_account_id(admin.value());
  }

  auto creation = parse_amount(creation_fee);
  auto extension = parse_amount(extension_fee);
  if (!creation || !extension) {
    spdlog::error("fees must be non-negative integers");
    spdlog::shutdown();
    return 1;
  }
  config.bootstrap_fee_schedule.creation_fee = creation.value();
  config.bootstrap_fee_schedule.extension_fee = extension.value();
  if (!collector_hex.empty()) {
    auto collector = try_make_account(collector_hex);
    if (!collector) {
      spdlog::error("--fee-collector must be a 32-byte hex account");
      spdlog::shutdown();
      return 1;
    }
    config.bootstrap_fee_schedule.collector = collector.value();
  }
  for (const auto& value : exempt_hex) {
    auto exempt = try_make_account(value);
    if (!exempt) {
      spdlog::error("invalid --fee-exempt account '{}'", value);
      spdlog::shutdown();
      return 1;
    }
    config.bootstrap_fee_schedule.exempt_accounts.push_back(exempt.value());
  }
  if (auto rejected = check_fee_schedule(config.bootstrap_fee_schedule)) {
    spdlog::error("{}", rejected.value());
    spdlog::shutdown();
    return 1;
  }

  auto ledger = lockbox::ledger::in_memory_ledger{};
  for (const auto& value : dev_assets) {
    auto asset_type = try_make_asset_type(value);
    if (!asset_type) {
      spdlog::error("invalid --dev-asset '{}'", value);
      spdlog::shutdown();
      return 1;
    }
    ledger.set_asset_info(asset_info_t{.asset_type = asset_type.value()});
  }
  for (const auto& value : dev_units) {
    if (!seed_unit(ledger, value)) {
      spdlog::error("invalid --dev-unit '{}'", value);
      spdlog::shutdown();
      return 1;
    }
  }
  for (const auto& value : dev_balances) {
    if (!seed_balance(ledger, value)) {
      spdlog::error("invalid --dev-balance '{}'", value);
      spdlog::shutdown();
      return 1;
    }
  }

  auto encoder = lockbox::execution::engine::encoder_t{};
  auto storage = lockbox::storage::make_storage<
      lockbox::storage::rocksdb_storage_tag>(db_path);
  auto engine = lockbox::execution::engine{encoder, storage,
                                           ledger.make_ports(), config};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = lockbox::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC service on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Lockbox stopped at sequence {}", engine.info().last_sequence);
  spdlog::shutdown();
  return 0;
}
