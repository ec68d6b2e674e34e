#pragma once
#include <lockbox/schema/associate_asset.hpp>
#include <lockbox/schema/create_lock.hpp>
#include <lockbox/schema/extend_lock_duration.hpp>
#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/set_administrator.hpp>
#include <lockbox/schema/set_paused.hpp>
#include <lockbox/schema/update_fee_schedule.hpp>
#include <lockbox/schema/withdraw_unlocked_asset.hpp>
#include <variant>

namespace lockbox::schema {

using transaction_payload_t = std::variant<associate_asset_t,
                                           create_lock_t,
                                           extend_lock_duration_t,
                                           withdraw_unlocked_asset_t,
                                           set_paused_t,
                                           update_fee_schedule_t,
                                           set_administrator_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace lockbox::schema
