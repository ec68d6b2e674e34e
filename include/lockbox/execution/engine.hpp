#pragma once

#include <lockbox/execution/lock_store.hpp>
#include <lockbox/execution/ports.hpp>
#include <lockbox/execution/signature_verifier.hpp>
#include <lockbox/execution/time_source.hpp>
#include <lockbox/schema/app_info.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/schema/fee_schedule.hpp>
#include <lockbox/schema/governance_state.hpp>
#include <lockbox/schema/lock_error_code.hpp>
#include <lockbox/schema/operation_result.hpp>
#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/query_result.hpp>
#include <lockbox/schema/transaction.hpp>
#include <lockbox/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace lockbox::execution {

inline constexpr lockbox::schema::duration_seconds_t kDefaultMinLockDuration =
    60;

/// Startup configuration. `bootstrap_*` values seed the store the first time
/// it is opened and are ignored afterwards.
struct engine_config final {
  lockbox::schema::hash32_t chain_id{};
  lockbox::schema::account_id_t custody_account;
  lockbox::schema::duration_seconds_t min_lock_duration{
      kDefaultMinLockDuration};
  bool require_strict_crypto{true};
  lockbox::schema::governance_state_t bootstrap_governance;
  lockbox::schema::fee_schedule_t bootstrap_fee_schedule;
};

/// Time-locked custody state machine.
///
/// The engine authenticates requests, runs the lock lifecycle against the
/// external ports and persists lock records, custody associations,
/// governance, fees and per-account nonces. Every mutating entry point is
/// serialized and rejects nested calls made from inside a port callback.
class engine final {
 public:
  using encoder_t = lockbox::schema::encoding::encoder<
      lockbox::schema::encoding::scale_encoder_tag>;
  using storage_t =
      lockbox::storage::storage<lockbox::storage::rocksdb_storage_tag>;

  /// Construct the engine and seed governance/fee state on first open.
  ///
  /// `require_strict_crypto` enables OpenSSL signature verification; when
  /// false, signatures are not checked.
  engine(encoder_t& encoder,
         storage_t& storage,
         ports ledger_ports,
         engine_config config,
         time_source_t clock = system_time_source());

  /// Decode and authenticate a request without changing any state.
  lockbox::schema::operation_result_t check_transaction(
      const lockbox::schema::bytes_view_t& raw_tx);

  /// Decode, authenticate and apply a request.
  ///
  /// Envelope failures leave the nonce untouched. Once a request reaches
  /// dispatch its nonce is consumed whether the operation succeeds or not.
  lockbox::schema::operation_result_t submit_transaction(
      const lockbox::schema::bytes_view_t& raw_tx);

  /// Lifecycle entry points for an already authenticated caller.
  lockbox::schema::operation_result_t associate_asset(
      const lockbox::schema::associate_asset_t& request,
      const lockbox::schema::account_id_t& caller);
  lockbox::schema::operation_result_t create_lock(
      const lockbox::schema::create_lock_t& request,
      const lockbox::schema::account_id_t& caller);
  lockbox::schema::operation_result_t extend_lock_duration(
      const lockbox::schema::extend_lock_duration_t& request,
      const lockbox::schema::account_id_t& caller);
  lockbox::schema::operation_result_t withdraw_unlocked_asset(
      const lockbox::schema::withdraw_unlocked_asset_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);

  /// Administrator-only entry points.
  lockbox::schema::operation_result_t set_paused(
      const lockbox::schema::set_paused_t& request,
      const lockbox::schema::account_id_t& caller);
  lockbox::schema::operation_result_t update_fee_schedule(
      const lockbox::schema::update_fee_schedule_t& request,
      const lockbox::schema::account_id_t& caller);
  lockbox::schema::operation_result_t set_administrator(
      const lockbox::schema::set_administrator_t& request,
      const lockbox::schema::account_id_t& caller);

  /// Current lock for a unit, if any.
  std::optional<lockbox::schema::lock_record_t> get_locked_asset(
      const lockbox::schema::asset_type_id_t& asset_type,
      const lockbox::schema::serial_number_t& serial_number) const;

  std::vector<lockbox::schema::lock_record_t> list_locks() const;
  lockbox::schema::governance_state_t governance() const;
  lockbox::schema::fee_schedule_t fee_schedule() const;
  uint64_t next_nonce(const lockbox::schema::account_id_t& account) const;
  bool is_associated(const lockbox::schema::asset_type_id_t& asset_type) const;
  const lockbox::schema::account_id_t& custody_account() const;

  /// Return application metadata (last sequence and state root).
  lockbox::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  lockbox::schema::query_result_t query(
      std::string_view path,
      const lockbox::schema::bytes_view_t& data) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  using pending_writes_t = std::vector<lockbox::storage::write_entry_t>;

  /// Serialize, reject nested calls, apply `payload` and persist the outcome.
  /// `nonce_write` is persisted whether or not the operation succeeds.
  lockbox::schema::operation_result_t run(
      const lockbox::schema::transaction_payload_t& payload,
      const lockbox::schema::account_id_t& caller,
      std::optional<lockbox::storage::write_entry_t> nonce_write =
          std::nullopt);

  lockbox::schema::operation_result_t dispatch(
      const lockbox::schema::transaction_payload_t& payload,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);

  /// Validate envelope version, chain id, nonce and signature.
  lockbox::schema::operation_result_t validate_transaction(
      const lockbox::schema::transaction_t& tx,
      std::string_view codespace) const;

  lockbox::schema::operation_result_t apply_associate_asset(
      const lockbox::schema::associate_asset_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);
  lockbox::schema::operation_result_t apply_create_lock(
      const lockbox::schema::create_lock_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);
  lockbox::schema::operation_result_t apply_extend_lock_duration(
      const lockbox::schema::extend_lock_duration_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);
  lockbox::schema::operation_result_t apply_withdraw_unlocked_asset(
      const lockbox::schema::withdraw_unlocked_asset_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);
  lockbox::schema::operation_result_t apply_set_paused(
      const lockbox::schema::set_paused_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);
  lockbox::schema::operation_result_t apply_update_fee_schedule(
      const lockbox::schema::update_fee_schedule_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);
  lockbox::schema::operation_result_t apply_set_administrator(
      const lockbox::schema::set_administrator_t& request,
      const lockbox::schema::account_id_t& caller,
      pending_writes_t& pending);

  /// Eligibility of `asset_type` per the asset ledger's metadata.
  std::optional<lockbox::schema::operation_result_t> check_eligibility(
      const lockbox::schema::asset_type_id_t& asset_type,
      std::string_view codespace) const;

  /// Charge `amount` unless the payer is exempt or the amount is zero.
  bool charge(const lockbox::schema::fee_schedule_t& schedule,
              const lockbox::schema::account_id_t& payer,
              const lockbox::schema::amount_t& amount) const;

  /// Fold the applied request into the state root and persist everything
  /// staged for it in one batch.
  void commit(const lockbox::schema::transaction_payload_t& payload,
              const lockbox::schema::account_id_t& caller,
              const pending_writes_t& pending);

  /// Seed governance and fees on first open, then load the checkpoint.
  void load_persisted_state();

  mutable std::recursive_mutex mutex_;
  bool call_in_progress_{false};
  encoder_t& encoder_;
  storage_t& storage_;
  lock_store locks_;
  ports ports_;
  engine_config config_;
  time_source_t clock_;
  uint64_t last_sequence_{};
  lockbox::schema::hash32_t state_root_{};
  signature_verifier_t signature_verifier_;
};

}  // namespace lockbox::execution
