#pragma once

#include <array>
#include <lockbox/schema/primitives.hpp>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Custody workflow: Defines canonical key prefixes and key codecs for lock
// records, custody associations, governance and replay protection.
namespace lockbox::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kLockKeyPrefix{"SYS|STATE|LOCK|"};
inline constexpr std::string_view kAssociationKeyPrefix{
    "SYS|STATE|ASSOCIATION|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kGovernanceKey{"SYS|STATE|GOVERNANCE"};
inline constexpr std::string_view kFeeScheduleKey{"SYS|STATE|FEE_SCHEDULE"};

inline const std::array<std::string_view, 6> kEngineKeyspaces{
    kStatePrefix,          kLockKeyPrefix, kAssociationKeyPrefix,
    kNonceKeyPrefix,       kGovernanceKey, kFeeScheduleKey};

template <typename Encoder, typename T>
lockbox::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
lockbox::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
lockbox::schema::bytes_t make_lock_key(
    Encoder& encoder,
    const lockbox::schema::asset_type_id_t& asset_type,
    const lockbox::schema::serial_number_t& serial_number) {
  return make_prefixed_key(encoder, kLockKeyPrefix,
                           std::tuple{asset_type, serial_number});
}

template <typename Encoder>
lockbox::schema::bytes_t make_association_key(
    Encoder& encoder,
    const lockbox::schema::asset_type_id_t& asset_type) {
  return make_prefixed_key(encoder, kAssociationKeyPrefix, asset_type);
}

template <typename Encoder>
lockbox::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const lockbox::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, account);
}

template <typename Encoder>
lockbox::schema::bytes_t make_governance_key(Encoder& encoder) {
  return make_prefix_key(encoder, kGovernanceKey);
}

template <typename Encoder>
lockbox::schema::bytes_t make_fee_schedule_key(Encoder& encoder) {
  return make_prefix_key(encoder, kFeeScheduleKey);
}

}  // namespace lockbox::schema::key
