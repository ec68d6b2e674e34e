#pragma once
#include <lockbox/schema/primitives.hpp>

// Schema type: create lock.
// Deposits one unit from the caller into custody for `beneficiary` for at
// least `duration` seconds.
namespace lockbox::schema {

template <uint16_t Version>
struct create_lock;

template <>
struct create_lock<1> final {
  uint16_t version{1};
  asset_type_id_t asset_type;
  serial_number_t serial_number;
  account_id_t beneficiary;
  duration_seconds_t duration{};
};

using create_lock_t = create_lock<1>;

}  // namespace lockbox::schema
