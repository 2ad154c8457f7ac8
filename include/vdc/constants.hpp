#pragma once

#include <cstddef>

/// @file include/vdc/constants.hpp
/// @brief Fixed patterns and bounds shared by the vdc-common utilities.

namespace vdc::constants {

// ─── Date Patterns ────────────────────────────────────────────────────────────

/// Wire pattern for calendar dates, e.g. `2023-06-15`.
static constexpr const char* DATE_PATTERN = "yyyy-MM-dd";

/// Wire pattern for second-precision date-times, e.g. `2023-06-15T08:30:00`.
static constexpr const char* DATE_TIME_PATTERN = "yyyy-MM-dd'T'HH:mm:ss";

/// Exact length of a text matching DATE_PATTERN.
static constexpr std::size_t DATE_LENGTH = 10;

/// Exact length of a text matching DATE_TIME_PATTERN.
static constexpr std::size_t DATE_TIME_LENGTH = 19;

/// Separator between the date and time halves of a date-time.
static constexpr char DATE_TIME_SEPARATOR = 'T';

// ─── Year Bounds ──────────────────────────────────────────────────────────────

/// Smallest year representable with the four-digit `yyyy` field.
/// Year-of-era starts at 1; 0000 is rejected.
static constexpr int MIN_YEAR = 1;

/// Largest year representable with the four-digit `yyyy` field.
static constexpr int MAX_YEAR = 9999;

// ─── Schema Files ─────────────────────────────────────────────────────────────

/// Number of comma-separated columns in a schema row.
static constexpr std::size_t SCHEMA_COLUMNS = 5;

/// Separator between entries of the list column in a schema row.
static constexpr char SCHEMA_LIST_SEPARATOR = ';';

} // namespace vdc::constants
