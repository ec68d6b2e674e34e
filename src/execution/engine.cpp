#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <iterator>
#include <limits>
#include <lockbox/blake3/hash.hpp>
#include <lockbox/common/critical.hpp>
#include <lockbox/crypto/verify.hpp>
#include <lockbox/execution/eligibility_guard.hpp>
#include <lockbox/execution/engine.hpp>
#include <lockbox/schema/account.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/schema/key/engine_keys.hpp>
#include <lockbox/schema/query_error_code.hpp>
#include <lockbox/schema/signing.hpp>
#include <tuple>
#include <utility>

using namespace lockbox::schema;

namespace {

using encoder_t = lockbox::schema::encoding::encoder<
    lockbox::schema::encoding::scale_encoder_tag>;

inline constexpr auto kEnvelopeCodespace = std::string_view{"lockbox.envelope"};
inline constexpr auto kCheckCodespace = std::string_view{"lockbox.check"};
inline constexpr auto kAssociateCodespace =
    std::string_view{"lockbox.associate"};
inline constexpr auto kCreateCodespace = std::string_view{"lockbox.create"};
inline constexpr auto kExtendCodespace = std::string_view{"lockbox.extend"};
inline constexpr auto kWithdrawCodespace = std::string_view{"lockbox.withdraw"};
inline constexpr auto kAdminCodespace = std::string_view{"lockbox.admin"};
inline constexpr auto kQueryCodespace = std::string_view{"lockbox.query"};

// Marks the engine busy for the lifetime of one mutating call.
class call_guard final {
 public:
  explicit call_guard(bool& in_progress) : in_progress_{in_progress} {
    in_progress_ = true;
  }
  ~call_guard() { in_progress_ = false; }
  call_guard(const call_guard&) = delete;
  call_guard& operator=(const call_guard&) = delete;

 private:
  bool& in_progress_;
};

operation_result_t make_error(lock_error_code code,
                              std::string_view codespace,
                              std::string info) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

operation_result_t make_ok(std::string_view codespace) {
  auto result = operation_result_t{};
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(query_error_code code, std::string info) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

operation_event_attribute_t make_attribute(std::string key,
                                           std::string value,
                                           bool index = false) {
  auto attribute = operation_event_attribute_t{};
  attribute.key = std::move(key);
  attribute.value = std::move(value);
  attribute.index = index;
  return attribute;
}

operation_event_t make_event(
    std::string type,
    std::vector<operation_event_attribute_t> attributes) {
  auto event = operation_event_t{};
  event.type = std::move(type);
  event.attributes = std::move(attributes);
  return event;
}

std::string_view codespace_for(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const associate_asset_t&) { return kAssociateCodespace; },
          [](const create_lock_t&) { return kCreateCodespace; },
          [](const extend_lock_duration_t&) { return kExtendCodespace; },
          [](const withdraw_unlocked_asset_t&) { return kWithdrawCodespace; },
          [](const set_paused_t&) { return kAdminCodespace; },
          [](const update_fee_schedule_t&) { return kAdminCodespace; },
          [](const set_administrator_t&) { return kAdminCodespace; }},
      payload);
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  try {
    auto encoder = encoder_t{};
    auto tx = encoder.try_decode<transaction_t>(raw_tx);
    if (!tx) {
      error = "malformed transaction bytes";
    }
    return tx;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& payload,
                         const account_id_t& caller,
                         uint64_t sequence) {
  auto encoder = encoder_t{};
  auto encoded_sequence = encoder.encode(sequence);
  return lockbox::blake3::hash({bytes_view_t{seed}, bytes_view_t{payload},
                                bytes_view_t{caller.value},
                                bytes_view_t{encoded_sequence}});
}

}  // namespace

namespace lockbox::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               ports ledger_ports,
               engine_config config,
               time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      locks_{encoder, storage},
      ports_{std::move(ledger_ports)},
      config_{std::move(config)},
      clock_{std::move(clock)},
      signature_verifier_{lockbox::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  if (!ports_.associate || !ports_.transfer || !ports_.fee_balance ||
      !ports_.charge_fee || !ports_.asset_info) {
    lockbox::common::critical("every ledger port must be provided");
  }
  if (!clock_) {
    lockbox::common::critical("time source must be provided");
  }
  if (config_.custody_account.is_null()) {
    lockbox::common::critical("custody account must be configured");
  }
  if (config_.require_strict_crypto && !lockbox::crypto::available()) {
    lockbox::common::critical(
        "OpenSSL lacks ed25519/secp256k1 support required for strict crypto");
  }
  if (!config_.require_strict_crypto) {
    spdlog::warn("Signature verification disabled");
  }
  load_persisted_state();
  spdlog::info("Custody engine ready at sequence {} (custody account {})",
               last_sequence_, to_string(config_.custody_account));
}

void engine::load_persisted_state() {
  auto governance_key = key::make_governance_key(encoder_);
  if (!storage_.get<governance_state_t>(encoder_, governance_key)) {
    if (auto rejected = check_fee_schedule(config_.bootstrap_fee_schedule)) {
      lockbox::common::critical("invalid bootstrap fee schedule: {}",
                                rejected.value());
    }
    if (config_.bootstrap_governance.administrator.is_null()) {
      spdlog::warn("No administrator configured; pause and fee updates are "
                   "unavailable");
    }
    auto entries = pending_writes_t{};
    entries.emplace_back(governance_key,
                         encoder_.encode(config_.bootstrap_governance));
    entries.emplace_back(key::make_fee_schedule_key(encoder_),
                         encoder_.encode(config_.bootstrap_fee_schedule));
    storage_.commit(entries, lockbox::storage::committed_state{
                                 .sequence = 0,
                                 .state_root = make_zero_hash()});
    spdlog::info("Seeded governance and fee schedule");
  }
  if (auto committed = storage_.load_committed_state()) {
    last_sequence_ = committed->sequence;
    state_root_ = committed->state_root;
  }
}

operation_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(raw_tx, decode_error);
  if (!tx) {
    return make_error(lock_error_code::invalid_transaction, kCheckCodespace,
                      decode_error);
  }
  return validate_transaction(tx.value(), kCheckCodespace);
}

operation_result_t engine::submit_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  if (call_in_progress_) {
    spdlog::warn("Rejected nested submission");
    return make_error(lock_error_code::reentrancy_rejected,
                      kEnvelopeCodespace, "another operation is in progress");
  }
  auto decode_error = std::string{};
  auto tx = decode_transaction(raw_tx, decode_error);
  if (!tx) {
    spdlog::warn("Rejected undecodable transaction: {}", decode_error);
    return make_error(lock_error_code::invalid_transaction, kEnvelopeCodespace,
                      decode_error);
  }
  auto validation = validate_transaction(tx.value(), kEnvelopeCodespace);
  if (!validation.ok()) {
    spdlog::warn("Rejected transaction envelope: {} ({})", validation.log,
                 validation.info);
    return validation;
  }
  auto caller = make_account_id(tx->signer);
  auto nonce_write = lockbox::storage::write_entry_t{
      key::make_nonce_key(encoder_, caller), encoder_.encode(tx->nonce + 1)};
  return run(tx->payload, caller, std::move(nonce_write));
}

operation_result_t engine::validate_transaction(
    const transaction_t& tx,
    std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error(lock_error_code::unsupported_transaction_version,
                      codespace, "expected version 1");
  }
  if (tx.chain_id != config_.chain_id) {
    return make_error(lock_error_code::invalid_chain_id, codespace,
                      "chain id mismatch");
  }
  auto expected_nonce = next_nonce(make_account_id(tx.signer));
  if (tx.nonce != expected_nonce) {
    return make_error(
        lock_error_code::invalid_nonce, codespace,
        fmt::format("expected nonce {}, got {}", expected_nonce, tx.nonce));
  }
  if (config_.require_strict_crypto) {
    auto encoder = encoder_t{};
    auto message = make_signing_bytes(encoder, tx);
    if (!signature_verifier_(bytes_view_t{message}, tx.signer,
                             tx.signature)) {
      return make_error(lock_error_code::signature_verification_failed,
                        codespace, "signature does not match signer");
    }
  }
  return make_ok(codespace);
}

operation_result_t engine::associate_asset(const associate_asset_t& request,
                                           const account_id_t& caller) {
  return run(transaction_payload_t{request}, caller);
}

operation_result_t engine::create_lock(const create_lock_t& request,
                                       const account_id_t& caller) {
  return run(transaction_payload_t{request}, caller);
}

operation_result_t engine::extend_lock_duration(
    const extend_lock_duration_t& request,
    const account_id_t& caller) {
  return run(transaction_payload_t{request}, caller);
}

operation_result_t engine::withdraw_unlocked_asset(
    const withdraw_unlocked_asset_t& request,
    const account_id_t& caller) {
  return run(transaction_payload_t{request}, caller);
}

operation_result_t engine::set_paused(const set_paused_t& request,
                                      const account_id_t& caller) {
  return run(transaction_payload_t{request}, caller);
}

operation_result_t engine::update_fee_schedule(
    const update_fee_schedule_t& request,
    const account_id_t& caller) {
  return run(transaction_payload_t{request}, caller);
}

operation_result_t engine::set_administrator(
    const set_administrator_t& request,
    const account_id_t& caller) {
  return run(transaction_payload_t{request}, caller);
}

operation_result_t engine::run(
    const transaction_payload_t& payload,
    const account_id_t& caller,
    std::optional<lockbox::storage::write_entry_t> nonce_write) {
  auto lock = std::scoped_lock{mutex_};
  auto codespace = codespace_for(payload);
  if (call_in_progress_) {
    spdlog::warn("Rejected nested {} call from {}", codespace,
                 to_string(caller));
    return make_error(lock_error_code::reentrancy_rejected, codespace,
                      "another operation is in progress");
  }
  auto guard = call_guard{call_in_progress_};

  auto pending = pending_writes_t{};
  auto result = dispatch(payload, caller, pending);
  if (!result.ok()) {
    spdlog::warn("{} rejected for {}: {} ({})", codespace, to_string(caller),
                 result.log, result.info);
    pending.clear();
  }
  if (nonce_write) {
    pending.push_back(std::move(nonce_write.value()));
  }
  if (result.ok()) {
    commit(payload, caller, pending);
  } else {
    storage_.write(pending);
  }
  return result;
}

operation_result_t engine::dispatch(const transaction_payload_t& payload,
                                    const account_id_t& caller,
                                    pending_writes_t& pending) {
  return std::visit(
      overloaded{
          [&](const associate_asset_t& request) {
            return apply_associate_asset(request, caller, pending);
          },
          [&](const create_lock_t& request) {
            return apply_create_lock(request, caller, pending);
          },
          [&](const extend_lock_duration_t& request) {
            return apply_extend_lock_duration(request, caller, pending);
          },
          [&](const withdraw_unlocked_asset_t& request) {
            return apply_withdraw_unlocked_asset(request, caller, pending);
          },
          [&](const set_paused_t& request) {
            return apply_set_paused(request, caller, pending);
          },
          [&](const update_fee_schedule_t& request) {
            return apply_update_fee_schedule(request, caller, pending);
          },
          [&](const set_administrator_t& request) {
            return apply_set_administrator(request, caller, pending);
          }},
      payload);
}

operation_result_t engine::apply_associate_asset(
    const associate_asset_t& request,
    const account_id_t& caller,
    pending_writes_t& pending) {
  if (governance().paused) {
    return make_error(lock_error_code::paused, kAssociateCodespace,
                      "custody is paused");
  }
  if (request.asset_type.is_null() || caller.is_null()) {
    return make_error(lock_error_code::invalid_input, kAssociateCodespace,
                      "asset type and caller must be set");
  }
  if (auto rejected = check_eligibility(request.asset_type,
                                        kAssociateCodespace)) {
    return rejected.value();
  }

  auto result = make_ok(kAssociateCodespace);
  if (is_associated(request.asset_type)) {
    result.info = "already associated";
    return result;
  }
  if (!ports_.associate(config_.custody_account, request.asset_type)) {
    spdlog::error("Ledger refused association of {} with custody",
                  to_string(request.asset_type));
    return make_error(lock_error_code::transfer_failed, kAssociateCodespace,
                      "ledger refused association");
  }
  pending.emplace_back(key::make_association_key(encoder_, request.asset_type),
                       encoder_.encode(true));
  result.events.push_back(make_event(
      "asset_associated",
      {make_attribute("asset_type", to_string(request.asset_type), true)}));
  return result;
}

operation_result_t engine::apply_create_lock(const create_lock_t& request,
                                             const account_id_t& caller,
                                             pending_writes_t& pending) {
  if (governance().paused) {
    return make_error(lock_error_code::paused, kCreateCodespace,
                      "custody is paused");
  }
  if (request.asset_type.is_null()) {
    return make_error(lock_error_code::invalid_input, kCreateCodespace,
                      "asset type must be set");
  }
  if (request.beneficiary.is_null() || caller.is_null()) {
    return make_error(lock_error_code::invalid_input, kCreateCodespace,
                      "beneficiary and caller must be set");
  }
  if (!request.serial_number.is_valid()) {
    return make_error(lock_error_code::invalid_input, kCreateCodespace,
                      "serial number must be positive");
  }
  if (request.duration <= config_.min_lock_duration) {
    return make_error(lock_error_code::invalid_input, kCreateCodespace,
                      fmt::format("duration must exceed {} seconds",
                                  config_.min_lock_duration));
  }
  if (locks_.exists(request.asset_type, request.serial_number)) {
    return make_error(lock_error_code::lock_already_exists, kCreateCodespace,
                      "unit is already locked");
  }
  if (auto rejected =
          check_eligibility(request.asset_type, kCreateCodespace)) {
    return rejected.value();
  }

  auto now = clock_();
  if (request.duration >
      std::numeric_limits<timestamp_seconds_t>::max() - now) {
    return make_error(lock_error_code::invalid_input, kCreateCodespace,
                      "release time overflows");
  }

  // Preflight the fee so a doomed charge never moves the unit.
  auto schedule = fee_schedule();
  auto fee = schedule.creation_fee;
  if (fee > 0 && !is_fee_exempt(schedule, caller) &&
      ports_.fee_balance(caller) < fee) {
    return make_error(lock_error_code::fee_charge_failed, kCreateCodespace,
                      "insufficient fee balance");
  }

  if (!ports_.transfer(request.asset_type, request.serial_number, caller,
                       config_.custody_account)) {
    spdlog::error("Transfer of {}#{} into custody failed",
                  to_string(request.asset_type), request.serial_number.value);
    return make_error(lock_error_code::transfer_failed, kCreateCodespace,
                      "asset transfer into custody failed");
  }

  if (!charge(schedule, caller, fee)) {
    spdlog::warn("Creation fee charge failed for {}; returning {}#{}",
                 to_string(caller), to_string(request.asset_type),
                 request.serial_number.value);
    if (!ports_.transfer(request.asset_type, request.serial_number,
                         config_.custody_account, caller)) {
      spdlog::error("Could not return {}#{} to {}; unit held without a lock",
                    to_string(request.asset_type), request.serial_number.value,
                    to_string(caller));
      return make_error(lock_error_code::fee_charge_failed, kCreateCodespace,
                        "fee charge failed and unit could not be returned");
    }
    return make_error(lock_error_code::fee_charge_failed, kCreateCodespace,
                      "fee charge failed");
  }

  auto record = lock_record_t{.asset_type = request.asset_type,
                              .serial_number = request.serial_number,
                              .creator = caller,
                              .beneficiary = request.beneficiary,
                              .start = now,
                              .duration = request.duration};
  pending.push_back(locks_.stage_put(record));

  auto result = make_ok(kCreateCodespace);
  result.data = encoder_.encode(record);
  result.events.push_back(make_event(
      "lock_created",
      {make_attribute("asset_type", to_string(record.asset_type), true),
       make_attribute("serial_number",
                      std::to_string(record.serial_number.value), true),
       make_attribute("creator", to_string(record.creator)),
       make_attribute("beneficiary", to_string(record.beneficiary), true),
       make_attribute("duration", std::to_string(record.duration))}));
  return result;
}

operation_result_t engine::apply_extend_lock_duration(
    const extend_lock_duration_t& request,
    const account_id_t& caller,
    pending_writes_t& pending) {
  if (request.asset_type.is_null() || !request.serial_number.is_valid()) {
    return make_error(lock_error_code::invalid_input, kExtendCodespace,
                      "asset type and positive serial number required");
  }
  auto record = locks_.find(request.asset_type, request.serial_number);
  if (!record) {
    return make_error(lock_error_code::lock_not_found, kExtendCodespace,
                      "no lock for unit");
  }
  if (request.extra_duration == 0) {
    return make_error(lock_error_code::invalid_input, kExtendCodespace,
                      "extra duration must be positive");
  }
  if (caller != record->beneficiary) {
    return make_error(lock_error_code::unauthorized, kExtendCodespace,
                      "only the beneficiary may extend");
  }

  auto extended = record.value();
  if (request.extra_duration >
      std::numeric_limits<duration_seconds_t>::max() - extended.duration) {
    return make_error(lock_error_code::invalid_input, kExtendCodespace,
                      "duration overflows");
  }
  extended.duration += request.extra_duration;
  if (!release_time(extended)) {
    return make_error(lock_error_code::invalid_input, kExtendCodespace,
                      "release time overflows");
  }

  auto schedule = fee_schedule();
  if (!charge(schedule, caller, schedule.extension_fee)) {
    return make_error(lock_error_code::fee_charge_failed, kExtendCodespace,
                      "extension fee charge failed");
  }
  pending.push_back(locks_.stage_put(extended));

  auto result = make_ok(kExtendCodespace);
  result.data = encoder_.encode(extended);
  result.events.push_back(make_event(
      "lock_duration_extended",
      {make_attribute("asset_type", to_string(extended.asset_type), true),
       make_attribute("serial_number",
                      std::to_string(extended.serial_number.value), true),
       make_attribute("extra_duration",
                      std::to_string(request.extra_duration))}));
  return result;
}

operation_result_t engine::apply_withdraw_unlocked_asset(
    const withdraw_unlocked_asset_t& request,
    const account_id_t& caller,
    pending_writes_t& pending) {
  if (request.asset_type.is_null() || !request.serial_number.is_valid()) {
    return make_error(lock_error_code::invalid_input, kWithdrawCodespace,
                      "asset type and positive serial number required");
  }
  auto record = locks_.find(request.asset_type, request.serial_number);
  if (!record) {
    return make_error(lock_error_code::lock_not_found, kWithdrawCodespace,
                      "no lock for unit");
  }
  auto now = clock_();
  auto release = release_time(record.value());
  if (!release || now < release.value()) {
    return make_error(
        lock_error_code::not_yet_expired, kWithdrawCodespace,
        fmt::format("releases at {}, now {}", release.value_or(0), now));
  }
  if (auto rejected =
          check_eligibility(request.asset_type, kWithdrawCodespace)) {
    return rejected.value();
  }

  // Cleared before the transfer so a nested call observes no lock.
  locks_.erase(request.asset_type, request.serial_number);
  if (!ports_.transfer(request.asset_type, request.serial_number,
                       config_.custody_account, record->beneficiary)) {
    spdlog::error("Release of {}#{} to {} failed",
                  to_string(request.asset_type), request.serial_number.value,
                  to_string(record->beneficiary));
    locks_.restore(record.value());
    return make_error(lock_error_code::transfer_failed, kWithdrawCodespace,
                      "asset transfer to beneficiary failed");
  }
  // The checkpoint batch repeats the deletion so it lands with the sequence.
  pending.push_back(
      locks_.stage_erase(request.asset_type, request.serial_number));

  auto result = make_ok(kWithdrawCodespace);
  result.events.push_back(make_event(
      "unlocked_asset_withdrawn",
      {make_attribute("asset_type", to_string(record->asset_type), true),
       make_attribute("serial_number",
                      std::to_string(record->serial_number.value), true),
       make_attribute("actor", to_string(caller)),
       make_attribute("beneficiary", to_string(record->beneficiary))}));
  return result;
}

operation_result_t engine::apply_set_paused(const set_paused_t& request,
                                            const account_id_t& caller,
                                            pending_writes_t& pending) {
  auto state = governance();
  if (state.administrator.is_null() || caller != state.administrator) {
    return make_error(lock_error_code::unauthorized, kAdminCodespace,
                      "administrator only");
  }
  state.paused = request.paused;
  pending.emplace_back(key::make_governance_key(encoder_),
                       encoder_.encode(state));
  spdlog::info("Custody {}", state.paused ? "paused" : "resumed");

  auto result = make_ok(kAdminCodespace);
  result.events.push_back(make_event(
      "pause_state_changed",
      {make_attribute("paused", state.paused ? "true" : "false")}));
  return result;
}

operation_result_t engine::apply_update_fee_schedule(
    const update_fee_schedule_t& request,
    const account_id_t& caller,
    pending_writes_t& pending) {
  auto administrator = governance().administrator;
  if (administrator.is_null() || caller != administrator) {
    return make_error(lock_error_code::unauthorized, kAdminCodespace,
                      "administrator only");
  }
  const auto& schedule = request.schedule;
  if (auto rejected = check_fee_schedule(schedule)) {
    return make_error(lock_error_code::invalid_input, kAdminCodespace,
                      std::move(rejected.value()));
  }
  pending.emplace_back(key::make_fee_schedule_key(encoder_),
                       encoder_.encode(schedule));

  auto result = make_ok(kAdminCodespace);
  result.events.push_back(make_event(
      "fee_schedule_updated",
      {make_attribute("creation_fee", schedule.creation_fee.str()),
       make_attribute("extension_fee", schedule.extension_fee.str()),
       make_attribute("collector", to_string(schedule.collector)),
       make_attribute("exempt_accounts",
                      std::to_string(schedule.exempt_accounts.size()))}));
  return result;
}

operation_result_t engine::apply_set_administrator(
    const set_administrator_t& request,
    const account_id_t& caller,
    pending_writes_t& pending) {
  auto state = governance();
  if (state.administrator.is_null() || caller != state.administrator) {
    return make_error(lock_error_code::unauthorized, kAdminCodespace,
                      "administrator only");
  }
  if (request.administrator.is_null()) {
    return make_error(lock_error_code::invalid_input, kAdminCodespace,
                      "administrator must be set");
  }
  auto previous = state.administrator;
  state.administrator = request.administrator;
  pending.emplace_back(key::make_governance_key(encoder_),
                       encoder_.encode(state));

  auto result = make_ok(kAdminCodespace);
  result.events.push_back(make_event(
      "administrator_changed",
      {make_attribute("previous", to_string(previous)),
       make_attribute("administrator", to_string(state.administrator))}));
  return result;
}

std::optional<operation_result_t> engine::check_eligibility(
    const asset_type_id_t& asset_type,
    std::string_view codespace) const {
  auto reason = check_lockable(ports_.asset_info(asset_type));
  if (!reason) {
    return std::nullopt;
  }
  return make_error(lock_error_code::ineligible_asset, codespace,
                    std::move(reason.value()));
}

bool engine::charge(const fee_schedule_t& schedule,
                    const account_id_t& payer,
                    const amount_t& amount) const {
  if (amount == 0 || is_fee_exempt(schedule, payer)) {
    return true;
  }
  return ports_.charge_fee(payer, schedule.collector, amount);
}

void engine::commit(const transaction_payload_t& payload,
                    const account_id_t& caller,
                    const pending_writes_t& pending) {
  auto sequence = last_sequence_ + 1;
  auto root = fold_state_root(state_root_, encoder_.encode(payload), caller,
                              sequence);
  storage_.commit(pending, lockbox::storage::committed_state{
                               .sequence = sequence, .state_root = root});
  last_sequence_ = sequence;
  state_root_ = root;
  spdlog::debug("Applied {} at sequence {}", codespace_for(payload),
                sequence);
}

std::optional<lock_record_t> engine::get_locked_asset(
    const asset_type_id_t& asset_type,
    const serial_number_t& serial_number) const {
  auto lock = std::scoped_lock{mutex_};
  return locks_.find(asset_type, serial_number);
}

std::vector<lock_record_t> engine::list_locks() const {
  auto lock = std::scoped_lock{mutex_};
  return locks_.list();
}

governance_state_t engine::governance() const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<governance_state_t>(encoder_, key::make_governance_key(encoder_))
      .value_or(governance_state_t{});
}

fee_schedule_t engine::fee_schedule() const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<fee_schedule_t>(encoder_, key::make_fee_schedule_key(encoder_))
      .value_or(fee_schedule_t{});
}

uint64_t engine::next_nonce(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<uint64_t>(encoder_, key::make_nonce_key(encoder_, account))
      .value_or(1);
}

bool engine::is_associated(const asset_type_id_t& asset_type) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<bool>(encoder_, key::make_association_key(encoder_, asset_type))
      .value_or(false);
}

const account_id_t& engine::custody_account() const {
  return config_.custody_account;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto info = app_info_t{};
  info.last_sequence = last_sequence_;
  info.state_root = state_root_;
  return info;
}

query_result_t engine::query(std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.sequence = last_sequence_;
  result.codespace = std::string{kQueryCodespace};
  auto encoder = encoder_t{};

  if (path == "/engine/info") {
    result.value = encoder.encode(info());
    return result;
  }
  if (path == "/state/lock") {
    auto key = encoder.try_decode<std::tuple<asset_type_id_t, serial_number_t>>(
        data);
    if (!key) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE tuple(asset_type, serial)");
    }
    auto record = locks_.find(std::get<0>(key.value()), std::get<1>(key.value()));
    if (!record) {
      return make_query_error(query_error_code::not_found, "no lock for unit");
    }
    result.key = make_bytes(data);
    result.value = encoder.encode(record.value());
    return result;
  }
  if (path == "/state/locks") {
    result.value = encoder.encode(locks_.list());
    return result;
  }
  if (path == "/state/association") {
    auto asset_type = encoder.try_decode<asset_type_id_t>(data);
    if (!asset_type) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE asset_type");
    }
    result.key = make_bytes(data);
    result.value = encoder.encode(is_associated(asset_type.value()));
    return result;
  }
  if (path == "/state/fee_schedule") {
    result.value = encoder.encode(fee_schedule());
    return result;
  }
  if (path == "/state/governance") {
    result.value = encoder.encode(governance());
    return result;
  }
  if (path == "/state/nonce") {
    auto account = encoder.try_decode<account_id_t>(data);
    if (!account) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE account");
    }
    result.key = make_bytes(data);
    result.value = encoder.encode(next_nonce(account.value()));
    return result;
  }
  return make_query_error(query_error_code::unsupported_path,
                          std::string{path});
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!config_.require_strict_crypto) {
    return;
  }
  signature_verifier_ = std::move(verifier);
  spdlog::info("Installed custom signature verifier");
}

}  // namespace lockbox::execution
