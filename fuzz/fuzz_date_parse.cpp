/**
 * @file  fuzz_date_parse.cpp
 * @brief libFuzzer target for DateTimeBinder parsing
 *
 * Build:
 *   cmake -DVDC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_date_parse
 *
 * Run for 60 seconds:
 *   ./fuzz_date_parse -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. try_parse_date / try_parse_date_time never throw and never crash.
 *   2. parse_* throws FormatError exactly when try_parse_* returns nullopt.
 *   3. Anything that parses formats back to the identical text (the
 *      patterns have exactly one spelling per value).
 *
 * Fuzzer strategy:
 *   Input bytes are used verbatim as the text, including embedded NULs and
 *   non-ASCII bytes.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "vdc/date_time.hpp"
#include "vdc/errors.hpp"

using vdc::binding::DateTimeBinder;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string text(reinterpret_cast<const char*>(data), size);

    // ── Dates ────────────────────────────────────────────────────────────────
    const auto date = DateTimeBinder::try_parse_date(text);
    bool threw = false;
    try {
        (void)DateTimeBinder::parse_date(text);
    } catch (const vdc::FormatError&) {
        threw = true;
    }
    assert(threw == !date.has_value());
    if (date) {
        assert(*DateTimeBinder::format_date(*date) == text);
    }

    // ── Date-times ───────────────────────────────────────────────────────────
    const auto date_time = DateTimeBinder::try_parse_date_time(text);
    threw = false;
    try {
        (void)DateTimeBinder::parse_date_time(text);
    } catch (const vdc::FormatError&) {
        threw = true;
    }
    assert(threw == !date_time.has_value());
    if (date_time) {
        assert(*DateTimeBinder::format_date_time(*date_time) == text);
    }

    return 0;
}
