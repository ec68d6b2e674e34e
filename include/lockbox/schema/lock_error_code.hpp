#pragma once

#include <lockbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: lock error code.
// Stable numeric outcome codes for submitted requests. Envelope failures sit
// below 10; lock lifecycle failures start at 10.
namespace lockbox::schema {

enum class lock_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  invalid_input = 10,
  lock_not_found = 11,
  lock_already_exists = 12,
  unauthorized = 13,
  not_yet_expired = 14,
  ineligible_asset = 15,
  transfer_failed = 16,
  fee_charge_failed = 17,
  reentrancy_rejected = 18,
  paused = 19,
};

inline constexpr auto kLockErrorCodeMappings = enum_mappings_t<
    lock_error_code, 15>{
    std::pair<std::string_view, lock_error_code>{
        "invalid_transaction", lock_error_code::invalid_transaction},
    std::pair<std::string_view, lock_error_code>{
        "unsupported_transaction_version",
        lock_error_code::unsupported_transaction_version},
    std::pair<std::string_view, lock_error_code>{
        "invalid_chain_id", lock_error_code::invalid_chain_id},
    std::pair<std::string_view, lock_error_code>{
        "invalid_nonce", lock_error_code::invalid_nonce},
    std::pair<std::string_view, lock_error_code>{
        "signature_verification_failed",
        lock_error_code::signature_verification_failed},
    std::pair<std::string_view, lock_error_code>{
        "invalid_input", lock_error_code::invalid_input},
    std::pair<std::string_view, lock_error_code>{
        "lock_not_found", lock_error_code::lock_not_found},
    std::pair<std::string_view, lock_error_code>{
        "lock_already_exists", lock_error_code::lock_already_exists},
    std::pair<std::string_view, lock_error_code>{"unauthorized",
                                                 lock_error_code::unauthorized},
    std::pair<std::string_view, lock_error_code>{
        "not_yet_expired", lock_error_code::not_yet_expired},
    std::pair<std::string_view, lock_error_code>{
        "ineligible_asset", lock_error_code::ineligible_asset},
    std::pair<std::string_view, lock_error_code>{
        "transfer_failed", lock_error_code::transfer_failed},
    std::pair<std::string_view, lock_error_code>{
        "fee_charge_failed", lock_error_code::fee_charge_failed},
    std::pair<std::string_view, lock_error_code>{
        "reentrancy_rejected", lock_error_code::reentrancy_rejected},
    std::pair<std::string_view, lock_error_code>{"paused",
                                                 lock_error_code::paused},
};

template <>
inline std::optional<lock_error_code> try_from_string<lock_error_code>(
    const std::string_view value) {
  return from_string(value, kLockErrorCodeMappings);
}

inline constexpr std::string_view to_string(const lock_error_code value) {
  return to_string(value, kLockErrorCodeMappings).value_or("unknown");
}

}  // namespace lockbox::schema
