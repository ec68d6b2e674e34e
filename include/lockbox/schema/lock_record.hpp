#pragma once
#include <lockbox/schema/primitives.hpp>
#include <optional>

// Schema type: lock record.
// One asset unit held in custody. `start` is fixed at creation; `duration`
// only grows through extension. A missing entry means "no lock".
namespace lockbox::schema {

template <uint16_t Version>
struct lock_record;

template <>
struct lock_record<1> final {
  uint16_t version{1};
  asset_type_id_t asset_type;
  serial_number_t serial_number;
  account_id_t creator;
  account_id_t beneficiary;
  timestamp_seconds_t start{};
  duration_seconds_t duration{};
};

using lock_record_t = lock_record<1>;

/// Earliest time the unit may be withdrawn, or std::nullopt when start +
/// duration does not fit in the timestamp type.
inline std::optional<timestamp_seconds_t> release_time(
    const lock_record_t& record) {
  if (record.duration > (UINT64_MAX - record.start)) {
    return std::nullopt;
  }
  return record.start + record.duration;
}

}  // namespace lockbox::schema
