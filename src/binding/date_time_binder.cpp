/// @file src/binding/date_time_binder.cpp
/// @brief DateTimeBinder: strict fixed-pattern parsing and formatting.

#include "vdc/date_time.hpp"
#include "vdc/constants.hpp"
#include "vdc/errors.hpp"

#include <fmt/core.h>

namespace vdc::binding {

namespace {

using namespace std::chrono;

/// Read `width` ASCII digits starting at `pos`.  Signs and spaces are not
/// digits, so `-1` or ` 1` in a numeric field fails here.
std::optional<int>
read_digits(std::string_view text, std::size_t pos, std::size_t width) noexcept {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

/// Scan a `yyyy-MM-dd` text.  On failure `reason` names the first problem.
std::optional<Date>
scan_date(std::string_view text, const char*& reason) noexcept {
    if (text.size() != constants::DATE_LENGTH) {
        reason = "expected exactly 10 characters";
        return std::nullopt;
    }
    if (text[4] != '-' || text[7] != '-') {
        reason = "expected '-' between year, month and day";
        return std::nullopt;
    }

    const auto y = read_digits(text, 0, 4);
    const auto m = read_digits(text, 5, 2);
    const auto d = read_digits(text, 8, 2);
    if (!y || !m || !d) {
        reason = "non-digit character in a numeric field";
        return std::nullopt;
    }
    if (*y < constants::MIN_YEAR) {
        reason = "year 0000 is not a valid year-of-era";
        return std::nullopt;
    }
    if (*m < 1 || *m > 12) {
        reason = "month must be 01..12";
        return std::nullopt;
    }

    const Date date{year{*y}, month{static_cast<unsigned>(*m)},
                    day{static_cast<unsigned>(*d)}};
    if (!date.ok()) {
        reason = "day does not exist in that month";
        return std::nullopt;
    }
    return date;
}

/// Scan a `yyyy-MM-dd'T'HH:mm:ss` text.
std::optional<DateTime>
scan_date_time(std::string_view text, const char*& reason) noexcept {
    if (text.size() != constants::DATE_TIME_LENGTH) {
        reason = "expected exactly 19 characters";
        return std::nullopt;
    }
    if (text[10] != constants::DATE_TIME_SEPARATOR) {
        reason = "expected 'T' between date and time";
        return std::nullopt;
    }

    const auto date = scan_date(text.substr(0, constants::DATE_LENGTH), reason);
    if (!date) {
        return std::nullopt;
    }

    if (text[13] != ':' || text[16] != ':') {
        reason = "expected ':' between hour, minute and second";
        return std::nullopt;
    }
    const auto hh = read_digits(text, 11, 2);
    const auto mm = read_digits(text, 14, 2);
    const auto ss = read_digits(text, 17, 2);
    if (!hh || !mm || !ss) {
        reason = "non-digit character in a numeric field";
        return std::nullopt;
    }
    if (*hh > 23 || *mm > 59 || *ss > 59) {
        reason = "time of day must be 00:00:00..23:59:59";
        return std::nullopt;
    }

    return local_days{*date} + hours{*hh} + minutes{*mm} + seconds{*ss};
}

/// Throw unless `date` is a valid calendar date inside the 4-digit year range.
void require_representable(const Date& date, const char* pattern) {
    const int y = static_cast<int>(date.year());
    if (!date.ok()) {
        throw FormatError(fmt::format(
            "Date {}-{}-{} is not a valid calendar date",
            y, static_cast<unsigned>(date.month()),
            static_cast<unsigned>(date.day())));
    }
    if (y < constants::MIN_YEAR || y > constants::MAX_YEAR) {
        throw FormatError(fmt::format(
            "Year {} cannot be represented by pattern {}", y, pattern));
    }
}

/// Throw unless `midnight` falls on a day in 0001-01-01..9999-12-31.  Checked
/// on the day count, since `year_month_day` wraps past year 32767.
void require_representable(std::chrono::local_days midnight, const char* pattern) {
    const local_days first{year{constants::MIN_YEAR} / January / 1};
    const local_days last{year{constants::MAX_YEAR} / December / 31};
    if (midnight < first || midnight > last) {
        throw FormatError(fmt::format(
            "Day {} relative to 1970-01-01 cannot be represented by pattern {}",
            midnight.time_since_epoch().count(), pattern));
    }
}

std::string format_ymd(const Date& date) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

} // anonymous namespace

// ─── Dates ────────────────────────────────────────────────────────────────────

Date DateTimeBinder::parse_date(std::string_view text) {
    const char* reason = "";
    auto date = scan_date(text, reason);
    if (!date) {
        throw FormatError(std::string(text), constants::DATE_PATTERN, reason);
    }
    return *date;
}

std::optional<Date>
DateTimeBinder::try_parse_date(std::string_view text) noexcept {
    const char* reason = "";
    return scan_date(text, reason);
}

std::optional<std::string>
DateTimeBinder::format_date(const std::optional<Date>& date) {
    if (!date) {
        return std::nullopt;
    }
    require_representable(*date, constants::DATE_PATTERN);
    return format_ymd(*date);
}

// ─── Date-times ───────────────────────────────────────────────────────────────

DateTime DateTimeBinder::parse_date_time(std::string_view text) {
    const char* reason = "";
    auto date_time = scan_date_time(text, reason);
    if (!date_time) {
        throw FormatError(std::string(text), constants::DATE_TIME_PATTERN, reason);
    }
    return *date_time;
}

std::optional<DateTime>
DateTimeBinder::try_parse_date_time(std::string_view text) noexcept {
    const char* reason = "";
    return scan_date_time(text, reason);
}

std::optional<std::string>
DateTimeBinder::format_date_time(const std::optional<DateTime>& date_time) {
    if (!date_time) {
        return std::nullopt;
    }

    // floor, not truncation: times before 1970 must still land on their own day.
    const auto midnight = std::chrono::floor<std::chrono::days>(*date_time);
    require_representable(midnight, constants::DATE_TIME_PATTERN);
    const Date date{midnight};

    const std::chrono::hh_mm_ss<std::chrono::seconds> tod{*date_time - midnight};
    return fmt::format("{}T{:02d}:{:02d}:{:02d}",
                       format_ymd(date),
                       tod.hours().count(),
                       tod.minutes().count(),
                       tod.seconds().count());
}

} // namespace vdc::binding
