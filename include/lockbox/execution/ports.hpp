#pragma once

#include <lockbox/schema/asset_info.hpp>
#include <lockbox/schema/primitives.hpp>
#include <functional>
#include <optional>

namespace lockbox::execution {

/// Collaborators outside the custody core. Every call completes synchronously
/// and reports success or failure; a failed call must leave the ledger
/// unchanged.
struct ports final {
  /// Enable `account` to hold units of `asset_type`.
  std::function<bool(const lockbox::schema::account_id_t& account,
                     const lockbox::schema::asset_type_id_t& asset_type)>
      associate;

  /// Move one unit from `from` to `to`.
  std::function<bool(const lockbox::schema::asset_type_id_t& asset_type,
                     const lockbox::schema::serial_number_t& serial_number,
                     const lockbox::schema::account_id_t& from,
                     const lockbox::schema::account_id_t& to)>
      transfer;

  /// Fee-token balance available to `account`.
  std::function<lockbox::schema::amount_t(
      const lockbox::schema::account_id_t& account)>
      fee_balance;

  /// Move `amount` fee tokens from `payer` to `collector`.
  std::function<bool(const lockbox::schema::account_id_t& payer,
                     const lockbox::schema::account_id_t& collector,
                     const lockbox::schema::amount_t& amount)>
      charge_fee;

  /// Collection metadata, or std::nullopt when the ledger does not know it.
  std::function<std::optional<lockbox::schema::asset_info_t>(
      const lockbox::schema::asset_type_id_t& asset_type)>
      asset_info;
};

}  // namespace lockbox::execution
