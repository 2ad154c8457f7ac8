#pragma once

/// @file include/vdc/types.hpp
/// @brief Shared value types for vdc-common.
///
/// Dates and date-times are plain `std::chrono` calendar values: immutable,
/// regular, and comparable with `==` and `<`.

#include <chrono>

namespace vdc {

/// A calendar date with no time-of-day and no zone.
using Date = std::chrono::year_month_day;

/// A zone-less date-time with second precision.
using DateTime = std::chrono::local_seconds;

} // namespace vdc
