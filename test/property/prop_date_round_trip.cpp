/**
 * @file  prop_date_round_trip.cpp
 * @brief Property: ∀ valid d: parse(format(d)) == d, for dates and date-times
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_date_round_trip
 *
 * Inputs are drawn as day (or second) offsets across the whole representable
 * range 0001-01-01 .. 9999-12-31, so leap days, century years and dates
 * before 1970 are all covered.
 *
 * Failure modes this test guards against:
 *   • Missing zero padding on year/month/day/time fields
 *   • Truncation instead of floor for instants before the epoch
 *   • Parser accepting text the formatter never produces (and vice versa)
 *   • Instants far outside 0001..9999 formatting as a wrapped-around year
 */

#include <rapidcheck.h>

#include <string>

#include "vdc/constants.hpp"
#include "vdc/date_time.hpp"
#include "vdc/errors.hpp"

using namespace vdc;
using namespace vdc::binding;
using namespace std::chrono;

namespace {

const long kFirstDay =
    local_days{year{constants::MIN_YEAR} / January / 1}.time_since_epoch().count();
const long kLastDay =
    local_days{year{constants::MAX_YEAR} / December / 31}.time_since_epoch().count();

Date date_from_offset(long offset) {
    return Date{local_days{days{offset}}};
}

} // namespace

int main() {
    bool ok = true;

    // ── Property 1: dates round-trip ────────────────────────────────────────
    ok &= rc::check(
        "round_trip: parse_date(format_date(d)) == d",
        [] {
            const long offset = *rc::gen::inRange(kFirstDay, kLastDay + 1);
            const Date d = date_from_offset(offset);

            const auto text = DateTimeBinder::format_date(d);
            RC_ASSERT(text.has_value());
            RC_ASSERT(text->size() == constants::DATE_LENGTH);
            RC_ASSERT(DateTimeBinder::parse_date(*text) == d);
        }
    );

    // ── Property 2: date-times round-trip at second resolution ──────────────
    ok &= rc::check(
        "round_trip: parse_date_time(format_date_time(t)) == t",
        [] {
            const long offset = *rc::gen::inRange(kFirstDay, kLastDay + 1);
            const int  second = *rc::gen::inRange(0, 86400);
            const DateTime t = local_days{days{offset}} + seconds{second};

            const auto text = DateTimeBinder::format_date_time(t);
            RC_ASSERT(text.has_value());
            RC_ASSERT(text->size() == constants::DATE_TIME_LENGTH);
            RC_ASSERT(DateTimeBinder::parse_date_time(*text) == t);
        }
    );

    // ── Property 3: the try_ variant agrees with the throwing one ───────────
    ok &= rc::check(
        "try_parse_date agrees with parse_date on arbitrary text",
        [](const std::string& text) {
            const auto maybe = DateTimeBinder::try_parse_date(text);
            if (maybe) {
                RC_ASSERT(DateTimeBinder::parse_date(text) == *maybe);
                RC_ASSERT(*DateTimeBinder::format_date(*maybe) == text);
            } else {
                RC_ASSERT_THROWS_AS((void)DateTimeBinder::parse_date(text), FormatError);
            }
        }
    );

    // ── Property 4: day-of-month past the end of the month never parses ─────
    ok &= rc::check(
        "parse_date rejects day beyond month end",
        [] {
            const long offset = *rc::gen::inRange(kFirstDay, kLastDay + 1);
            const Date d = date_from_offset(offset);
            const year_month_day_last last{d.year(), month_day_last{d.month()}};
            const unsigned past = static_cast<unsigned>(last.day()) + 1;
            if (past > 31) {
                return;  // no two-digit day to try
            }
            const std::string text = *DateTimeBinder::format_date(d);
            const std::string bad  = text.substr(0, 8) +
                                     (past < 10 ? "0" : "") + std::to_string(past);
            RC_ASSERT(!DateTimeBinder::try_parse_date(bad).has_value());
        }
    );

    // ── Property 5: any instant either formats faithfully or is refused ─────
    ok &= rc::check(
        "format_date_time: arbitrary instant round-trips or throws FormatError",
        [](long long raw) {
            const DateTime t{seconds{raw}};
            try {
                const auto text = DateTimeBinder::format_date_time(t);
                RC_ASSERT(DateTimeBinder::parse_date_time(*text) == t);
            } catch (const FormatError&) {
                const long long first =
                    duration_cast<seconds>(days{kFirstDay}).count();
                const long long last =
                    duration_cast<seconds>(days{kLastDay + 1}).count();
                RC_ASSERT(raw < first || raw >= last);
            }
        }
    );

    return ok ? 0 : 1;
}
