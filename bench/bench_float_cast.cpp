// bench/bench_float_cast.cpp — Benchmarks for decoding, narrowing and integer conversion.

#include <cstdint>
#include <random>

#include <benchmark/benchmark.h>

#include <apf/float.hpp>
#include <apf/util/random.hpp>

static void bench_decode_f64(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedf10a + static_cast<int>(state.thread_index()));
    while (state.KeepRunning()) {
        const auto value = apf::FP64::from_f64(apf::util::random_finite_f64(rng));
        benchmark::DoNotOptimize(value);
    }
}

static void bench_narrow_f64_to_f32(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedf10a + static_cast<int>(state.thread_index()) + 0x10);
    while (state.KeepRunning()) {
        const auto wide = apf::FP64::from_f64(apf::util::random_finite_f64(rng));
        benchmark::DoNotOptimize(wide.as_f32());
    }
}

static void bench_narrow_f32_to_f16(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedf10a + static_cast<int>(state.thread_index()) + 0x20);
    while (state.KeepRunning()) {
        const auto single = apf::FP32::from_f32(apf::util::random_finite_f32(rng));
        benchmark::DoNotOptimize(single.as_native_float<5, 10>());
    }
}

static void bench_widen_f64_to_f256(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedf10a + static_cast<int>(state.thread_index()) + 0x30);
    while (state.KeepRunning()) {
        const auto wide = apf::FP256::from_f64(apf::util::random_finite_f64(rng));
        benchmark::DoNotOptimize(wide);
    }
}

static void bench_from_u64(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedf10a + static_cast<int>(state.thread_index()) + 0x40);
    while (state.KeepRunning()) {
        const std::uint64_t value = rng();
        benchmark::DoNotOptimize(apf::FP32::from_u64(value));
    }
}

BENCHMARK(bench_decode_f64);
BENCHMARK(bench_narrow_f64_to_f32);
BENCHMARK(bench_narrow_f32_to_f16);
BENCHMARK(bench_widen_f64_to_f256);
BENCHMARK(bench_from_u64);

BENCHMARK_MAIN();
