#pragma once
#include <lockbox/schema/primitives.hpp>

// Schema type: extend lock duration.
// Beneficiary-only. Adds `extra_duration` seconds to a live lock.
namespace lockbox::schema {

template <uint16_t Version>
struct extend_lock_duration;

template <>
struct extend_lock_duration<1> final {
  uint16_t version{1};
  asset_type_id_t asset_type;
  serial_number_t serial_number;
  duration_seconds_t extra_duration{};
};

using extend_lock_duration_t = extend_lock_duration<1>;

}  // namespace lockbox::schema
