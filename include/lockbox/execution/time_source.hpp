#pragma once

#include <lockbox/schema/primitives.hpp>
#include <functional>

namespace lockbox::execution {

/// Seconds since the Unix epoch. Tests install a manual clock.
using time_source_t = std::function<lockbox::schema::timestamp_seconds_t()>;

time_source_t system_time_source();

}  // namespace lockbox::execution
