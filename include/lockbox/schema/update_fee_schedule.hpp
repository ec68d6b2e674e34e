#pragma once
#include <lockbox/schema/fee_schedule.hpp>

namespace lockbox::schema {

template <uint16_t Version>
struct update_fee_schedule;

template <>
struct update_fee_schedule<1> final {
  uint16_t version{1};
  fee_schedule_t schedule;
};

using update_fee_schedule_t = update_fee_schedule<1>;

}  // namespace lockbox::schema
