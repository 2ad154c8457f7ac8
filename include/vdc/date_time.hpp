#pragma once

/// @file include/vdc/date_time.hpp
/// @brief DateTimeBinder: fixed-pattern date and date-time text binding.
///
/// # Module: DateTimeBinder
///
/// ## Responsibility
/// Convert between `vdc::Date` / `vdc::DateTime` and the two wire patterns
/// used by the marshalling layer:
///   - `yyyy-MM-dd`              e.g. `2023-06-15`
///   - `yyyy-MM-dd'T'HH:mm:ss`   e.g. `2023-06-15T08:30:00`
///
/// Parsing is strict: exact field widths, exact separators, no surrounding
/// whitespace, and the fields must name a real calendar value.  `2023-02-30`
/// is rejected rather than adjusted to the end of the month.
///
/// ## Guarantees
/// - `parse_date(*format_date(d)) == d` for every valid `d` in years 1..9999
/// - Same round-trip law for date-times at second resolution
/// - An absent value formats as `nullopt`
/// - Thread-safe: all methods are stateless

#include "vdc/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vdc::binding {

/// Binds dates and date-times to their fixed-pattern text form.
///
/// All methods are static; the class holds no state.
class DateTimeBinder {
public:
    DateTimeBinder() = delete;

    // ── Dates ─────────────────────────────────────────────────────────────────

    /// Parse `text` strictly against `yyyy-MM-dd`.
    ///
    /// # Throws
    /// `FormatError` if the text does not match the pattern or names an
    /// invalid calendar date (month 13, Feb 30, year 0000).
    [[nodiscard]] static Date parse_date(std::string_view text);

    /// Same as `parse_date`, but returns `nullopt` instead of throwing.
    [[nodiscard]] static std::optional<Date>
    try_parse_date(std::string_view text) noexcept;

    /// Format `date` as `yyyy-MM-dd`.
    ///
    /// # Returns
    /// `nullopt` if no date is supplied.
    ///
    /// # Throws
    /// `FormatError` if the date is not a valid calendar date or its year lies
    /// outside 0001..9999.
    [[nodiscard]] static std::optional<std::string>
    format_date(const std::optional<Date>& date);

    // ── Date-times ────────────────────────────────────────────────────────────

    /// Parse `text` strictly against `yyyy-MM-dd'T'HH:mm:ss`.
    ///
    /// # Throws
    /// `FormatError` on a pattern mismatch, an invalid calendar date, or a
    /// time-of-day outside 00:00:00..23:59:59.
    [[nodiscard]] static DateTime parse_date_time(std::string_view text);

    /// Same as `parse_date_time`, but returns `nullopt` instead of throwing.
    [[nodiscard]] static std::optional<DateTime>
    try_parse_date_time(std::string_view text) noexcept;

    /// Format `date_time` as `yyyy-MM-dd'T'HH:mm:ss`; `nullopt` if absent.
    ///
    /// # Throws
    /// `FormatError` if the year lies outside 0001..9999.
    [[nodiscard]] static std::optional<std::string>
    format_date_time(const std::optional<DateTime>& date_time);
};

} // namespace vdc::binding
