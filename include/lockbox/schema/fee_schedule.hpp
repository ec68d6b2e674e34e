#pragma once
#include <lockbox/schema/primitives.hpp>
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

// Schema type: fee schedule.
// Process-wide lock fees. Mutated only by the administrator; read on every
// charge.
namespace lockbox::schema {

/// Ceiling for either fee, enforced when a schedule is configured.
inline const auto kMaxLockFee = amount_t{10'000'000'000ull};

template <uint16_t Version>
struct fee_schedule;

template <>
struct fee_schedule<1> final {
  uint16_t version{1};
  amount_t creation_fee{0};
  amount_t extension_fee{0};
  account_id_t collector;
  std::vector<account_id_t> exempt_accounts;
};

using fee_schedule_t = fee_schedule<1>;

inline bool is_fee_exempt(const fee_schedule_t& schedule,
                          const account_id_t& account) {
  return std::find(std::begin(schedule.exempt_accounts),
                   std::end(schedule.exempt_accounts),
                   account) != std::end(schedule.exempt_accounts);
}

inline bool within_fee_ceiling(const fee_schedule_t& schedule) {
  return schedule.creation_fee <= kMaxLockFee &&
         schedule.extension_fee <= kMaxLockFee;
}

/// Reason a schedule cannot be configured, if any. Applies to bootstrap
/// settings and administrator updates alike.
inline std::optional<std::string> check_fee_schedule(
    const fee_schedule_t& schedule) {
  if (!within_fee_ceiling(schedule)) {
    return "fees must not exceed " + kMaxLockFee.str();
  }
  if (schedule.collector.is_null() &&
      (schedule.creation_fee > 0 || schedule.extension_fee > 0)) {
    return std::string{"fee collector must be set when fees are charged"};
  }
  return std::nullopt;
}

}  // namespace lockbox::schema
