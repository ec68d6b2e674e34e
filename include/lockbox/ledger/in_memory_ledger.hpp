#pragma once

#include <lockbox/execution/ports.hpp>
#include <lockbox/schema/asset_info.hpp>
#include <lockbox/schema/primitives.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <utility>

namespace lockbox::ledger {

/// Reference asset ledger backing every custody port.
///
/// Tracks unit ownership, account/collection associations, fee-token balances
/// and collection metadata. A unit may only move to an account associated with
/// its collection. Interceptors run before a transfer or charge touches the
/// ledger; returning false fails the call with no change.
class in_memory_ledger final {
 public:
  using transfer_interceptor_t =
      std::function<bool(const lockbox::schema::asset_type_id_t& asset_type,
                         const lockbox::schema::serial_number_t& serial_number,
                         const lockbox::schema::account_id_t& from,
                         const lockbox::schema::account_id_t& to)>;
  using charge_interceptor_t =
      std::function<bool(const lockbox::schema::account_id_t& payer,
                         const lockbox::schema::account_id_t& collector,
                         const lockbox::schema::amount_t& amount)>;

  /// Register or replace collection metadata.
  void set_asset_info(const lockbox::schema::asset_info_t& info);
  void remove_asset_info(const lockbox::schema::asset_type_id_t& asset_type);

  /// Issue a unit to `owner`, associating the owner with the collection.
  /// Returns false when the unit already exists.
  bool mint(const lockbox::schema::asset_type_id_t& asset_type,
            const lockbox::schema::serial_number_t& serial_number,
            const lockbox::schema::account_id_t& owner);

  void credit(const lockbox::schema::account_id_t& account,
              const lockbox::schema::amount_t& amount);

  std::optional<lockbox::schema::account_id_t> owner_of(
      const lockbox::schema::asset_type_id_t& asset_type,
      const lockbox::schema::serial_number_t& serial_number) const;
  bool is_associated(const lockbox::schema::account_id_t& account,
                     const lockbox::schema::asset_type_id_t& asset_type) const;

  // Port operations.
  bool associate(const lockbox::schema::account_id_t& account,
                 const lockbox::schema::asset_type_id_t& asset_type);
  bool transfer(const lockbox::schema::asset_type_id_t& asset_type,
                const lockbox::schema::serial_number_t& serial_number,
                const lockbox::schema::account_id_t& from,
                const lockbox::schema::account_id_t& to);
  lockbox::schema::amount_t fee_balance(
      const lockbox::schema::account_id_t& account) const;
  bool charge_fee(const lockbox::schema::account_id_t& payer,
                  const lockbox::schema::account_id_t& collector,
                  const lockbox::schema::amount_t& amount);
  std::optional<lockbox::schema::asset_info_t> asset_info(
      const lockbox::schema::asset_type_id_t& asset_type) const;

  void set_transfer_interceptor(transfer_interceptor_t interceptor);
  void set_charge_interceptor(charge_interceptor_t interceptor);

  /// Port bundle bound to this ledger. The ledger must outlive the ports.
  lockbox::execution::ports make_ports();

 private:
  using unit_key_t = std::pair<lockbox::schema::asset_type_id_t,
                               lockbox::schema::serial_number_t>;

  mutable std::mutex mutex_;
  std::map<unit_key_t, lockbox::schema::account_id_t> owners_;
  std::set<std::pair<lockbox::schema::account_id_t,
                     lockbox::schema::asset_type_id_t>>
      associations_;
  std::map<lockbox::schema::account_id_t, lockbox::schema::amount_t>
      balances_;
  std::map<lockbox::schema::asset_type_id_t, lockbox::schema::asset_info_t>
      asset_infos_;
  transfer_interceptor_t transfer_interceptor_;
  charge_interceptor_t charge_interceptor_;
};

}  // namespace lockbox::ledger
