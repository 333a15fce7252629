/**
 * @file  bench/bench_correlation_vector.cpp
 * @brief Google Benchmark suite for correlation vector hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_Create_V1 / V2         — seed a fresh base
 *   BM_Extend                 — entry-point derivation from a header value
 *   BM_Spin                   — time + entropy segment
 *   BM_Parse                  — rebuild from the wire form
 *   BM_Increment              — per outbound call
 *   BM_Validate               — strict format check
 *
 * Build (CMake):
 *   cmake --build build --target bench_correlation_vector
 *   ./build/bench_correlation_vector --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "corrvec/correlation_vector.hpp"

#include <string>

namespace {

const std::string kHeaderV1 = "tul4NUsfs9Cl7mOf.1.2.3";
const std::string kHeaderV2 = "KeLbMqOWLU+gL5dqi3L5YA.0.17";

}  // namespace

static void BM_Create_V1(benchmark::State& state) {
    for (auto _ : state) {
        auto cv = corrvec::CorrelationVector::create(corrvec::Version::V1);
        benchmark::DoNotOptimize(cv);
    }
}
BENCHMARK(BM_Create_V1);

static void BM_Create_V2(benchmark::State& state) {
    for (auto _ : state) {
        auto cv = corrvec::CorrelationVector::create(corrvec::Version::V2);
        benchmark::DoNotOptimize(cv);
    }
}
BENCHMARK(BM_Create_V2);

static void BM_Extend(benchmark::State& state) {
    for (auto _ : state) {
        auto cv = corrvec::CorrelationVector::extend(kHeaderV2);
        benchmark::DoNotOptimize(cv);
    }
}
BENCHMARK(BM_Extend);

static void BM_Spin(benchmark::State& state) {
    for (auto _ : state) {
        auto cv = corrvec::CorrelationVector::spin(kHeaderV2);
        benchmark::DoNotOptimize(cv);
    }
}
BENCHMARK(BM_Spin);

static void BM_Parse(benchmark::State& state) {
    for (auto _ : state) {
        auto cv = corrvec::CorrelationVector::parse(kHeaderV1);
        benchmark::DoNotOptimize(cv);
    }
}
BENCHMARK(BM_Parse);

static void BM_Increment(benchmark::State& state) {
    auto cv = corrvec::CorrelationVector::parse(kHeaderV1);
    for (auto _ : state) {
        auto value = cv.increment();
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Increment);

static void BM_Validate(benchmark::State& state) {
    for (auto _ : state) {
        auto error = corrvec::CorrelationVector::validate(kHeaderV2, corrvec::Version::V2);
        benchmark::DoNotOptimize(error);
    }
}
BENCHMARK(BM_Validate);

BENCHMARK_MAIN();
