/**
 * @file  bench/bench_date_time.cpp
 * @brief Google Benchmark suite for date binding and field resolution.
 *
 * Benchmarks
 * ----------
 *   BM_ParseDate / BM_FormatDate
 *   BM_ParseDateTime / BM_FormatDateTime
 *   BM_AllInterfaces         — class chain of depth N, two interfaces per level
 *   BM_ResolveField_Deep     — field declared on the root of a depth-N chain
 *
 * Build (CMake):
 *   cmake -DVDC_BENCH=ON ..
 *   cmake --build . --target bench_date_time
 *   ./bench_date_time --benchmark_format=json
 *
 * Throughput units: items/second (texts parsed, dates formatted, lookups).
 */

#include "benchmark/benchmark.h"

#include "vdc/class_utils.hpp"
#include "vdc/date_time.hpp"
#include "vdc/field_utils.hpp"
#include "vdc/reflect.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using vdc::binding::DateTimeBinder;
using namespace vdc::reflect;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// `n` consecutive dates starting 1999-12-25, across the millennium rollover.
static std::vector<std::string> make_date_texts(std::size_t n) {
    using namespace std::chrono;
    std::vector<std::string> out;
    out.reserve(n);
    const local_days start{year{1999} / December / 25};
    for (std::size_t i = 0; i < n; ++i) {
        const vdc::Date d{start + days{static_cast<long>(i)}};
        out.push_back(*DateTimeBinder::format_date(d));
    }
    return out;
}

/// Class chain C0 <- C1 <- ... <- C{depth-1}.  Each level implements two
/// fresh interfaces; C0 declares a private field `root`.
static TypeRegistry make_chain(int depth) {
    TypeRegistry reg;
    std::string super;
    for (int d = 0; d < depth; ++d) {
        const std::string a = "A" + std::to_string(d);
        const std::string b = "B" + std::to_string(d);
        reg.define_interface(a);
        reg.define_interface(b, {a});
        const std::string name = "C" + std::to_string(d);
        std::vector<FieldSpec> fields;
        if (d == 0) fields.push_back({"root", Visibility::Private});
        reg.define_class(name, super, {b, a}, fields);
        super = name;
    }
    return reg;
}

// ── Date binding ───────────────────────────────────────────────────────────────

static void BM_ParseDate(benchmark::State& state) {
    const auto texts = make_date_texts(1024);
    std::size_t i = 0;
    for (auto _ : state) {
        auto d = DateTimeBinder::parse_date(texts[i++ & 1023]);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ParseDate);

static void BM_FormatDate(benchmark::State& state) {
    const vdc::Date d = DateTimeBinder::parse_date("2024-02-29");
    for (auto _ : state) {
        auto text = DateTimeBinder::format_date(d);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FormatDate);

static void BM_ParseDateTime(benchmark::State& state) {
    const std::string text = "2024-02-29T23:59:58";
    for (auto _ : state) {
        auto t = DateTimeBinder::parse_date_time(text);
        benchmark::DoNotOptimize(t);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ParseDateTime);

static void BM_FormatDateTime(benchmark::State& state) {
    const vdc::DateTime t = DateTimeBinder::parse_date_time("1969-07-20T20:17:40");
    for (auto _ : state) {
        auto text = DateTimeBinder::format_date_time(t);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FormatDateTime);

// ── Reflection walks ───────────────────────────────────────────────────────────

static void BM_AllInterfaces(benchmark::State& state) {
    const int depth = static_cast<int>(state.range(0));
    const TypeRegistry reg = make_chain(depth);
    const TypeDescriptor& leaf = reg.get("C" + std::to_string(depth - 1));
    for (auto _ : state) {
        auto result = ClassUtils::all_interfaces(&leaf);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_AllInterfaces)->RangeMultiplier(4)->Range(1, 256)->Unit(benchmark::kMicrosecond);

static void BM_ResolveField_Deep(benchmark::State& state) {
    const int depth = static_cast<int>(state.range(0));
    const TypeRegistry reg = make_chain(depth);
    const TypeDescriptor& leaf = reg.get("C" + std::to_string(depth - 1));
    for (auto _ : state) {
        auto found = FieldUtils::get_field(&leaf, "root", true);
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ResolveField_Deep)->RangeMultiplier(4)->Range(1, 256)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
