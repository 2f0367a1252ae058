// bench/bench_bigint_ops.cpp — Benchmarks for fixed-width integer arithmetic and shifts.

#include <cstddef>
#include <random>

#include <benchmark/benchmark.h>

#include <apf/core/bigint.hpp>
#include <apf/util/random.hpp>

namespace {

    using mantissa = apf::core::bigint<6>;

} // namespace

static void bench_bigint_add(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()));
    while (state.KeepRunning()) {
        auto lhs = apf::util::random_bigint<6>(rng);
        const auto rhs = apf::util::random_bigint<6>(rng);
        const bool carry = lhs.add_in_place(rhs);
        benchmark::DoNotOptimize(lhs);
        benchmark::DoNotOptimize(carry);
    }
}

static void bench_bigint_mul(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x10);
    while (state.KeepRunning()) {
        const auto lhs = apf::util::random_bigint<6>(rng, 192);
        const auto rhs = apf::util::random_bigint<6>(rng, 192);
        const auto product = lhs * rhs;
        benchmark::DoNotOptimize(product);
    }
}

static void bench_bigint_shift_with_loss(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x20);
    std::uniform_int_distribution<std::size_t> amount(1, mantissa::BITS - 1);
    while (state.KeepRunning()) {
        const auto value = apf::util::random_bigint<6>(rng);
        const auto [shifted, loss] = apf::core::shift_right_with_loss(value, amount(rng));
        benchmark::DoNotOptimize(shifted);
        benchmark::DoNotOptimize(loss);
    }
}

static void bench_bigint_msb(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x30);
    std::uniform_int_distribution<std::size_t> bits(0, mantissa::BITS);
    while (state.KeepRunning()) {
        const auto value = apf::util::random_bigint<6>(rng, bits(rng));
        benchmark::DoNotOptimize(value.msb_index());
    }
}

BENCHMARK(bench_bigint_add);
BENCHMARK(bench_bigint_mul);
BENCHMARK(bench_bigint_shift_with_loss);
BENCHMARK(bench_bigint_msb);

BENCHMARK_MAIN();
