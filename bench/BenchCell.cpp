//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <benchmark/benchmark.h>
#include <optional>
#include <string>
#include "absence/Cell.hpp"
#include "absence/Predicates.hpp"

using absence::Absential;
using absence::Cell;

// Benchmark a chain of map operations over an occupied cell
static void BM_Cell_MapChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto cell = Cell<int>::of(0);
        for (int i = 0; i < chain_length; ++i) {
            cell = cell.map([](int value) { return value + 1; });
        }
        benchmark::DoNotOptimize(cell);
    }
}
BENCHMARK(BM_Cell_MapChain)->Range(1, 1024);

// Benchmark a chain of map operations that short-circuit on an empty cell
static void BM_Cell_MapChainEmpty(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto cell = Cell<int>::empty();
        for (int i = 0; i < chain_length; ++i) {
            cell = cell.map([](int value) { return value + 1; });
        }
        benchmark::DoNotOptimize(cell);
    }
}
BENCHMARK(BM_Cell_MapChainEmpty)->Range(1, 1024);

// Benchmark a chain of flat_map operations
static void BM_Cell_FlatMapChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto cell = Cell<int>::of(0);
        for (int i = 0; i < chain_length; ++i) {
            cell = cell.flat_map([](int value) { return Cell<int>::of(value + 1); });
        }
        benchmark::DoNotOptimize(cell);
    }
}
BENCHMARK(BM_Cell_FlatMapChain)->Range(1, 1024);

// Benchmark map chains over heap allocated values
static void BM_Cell_StringMapChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto cell = Cell<std::string>::of(std::string("start"));
        for (int i = 0; i < chain_length; ++i) {
            cell = cell.map([](const std::string& value) { return value + "x"; });
        }
        benchmark::DoNotOptimize(cell);
    }
}
BENCHMARK(BM_Cell_StringMapChain)->Range(1, 256);

// Benchmark a fallback chain resolved by the last alternative
static void BM_Cell_OrElseChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));
    auto empty = Cell<int>::empty();
    auto last = Cell<int>::of(10);

    for (auto _ : state) {
        auto cell = empty;
        for (int i = 0; i < chain_length; ++i) {
            cell = cell.or_else(empty);
        }
        cell = cell.or_else(last);
        benchmark::DoNotOptimize(cell);
    }
}
BENCHMARK(BM_Cell_OrElseChain)->Range(1, 1024);

// Benchmark the filter/map/extract_or pipeline typical of constraint checks
static void BM_Cell_FilterMapExtract(benchmark::State& state) {
    int seed = 100;
    for (auto _ : state) {
        auto result = Cell<int>::of(seed)
            .filter([](int value) { return value > 0; })
            .map([](int value) { return value - 4; })
            .extract_or(0);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Cell_FilterMapExtract);

// Benchmark bridging to and from nullable values
static void BM_Cell_NullableRoundTrip(benchmark::State& state) {
    std::optional<int> nullable = 42;
    for (auto _ : state) {
        auto cell = Cell<int>::from_nullable(nullable);
        auto back = cell.to_nullable();
        benchmark::DoNotOptimize(back);
    }
}
BENCHMARK(BM_Cell_NullableRoundTrip);

// Benchmark the presence predicate on a raw slot
static void BM_Absential_IsPresent(benchmark::State& state) {
    Absential<int> slot = 42;
    for (auto _ : state) {
        auto present = absence::is_present(slot);
        benchmark::DoNotOptimize(present);
    }
}
BENCHMARK(BM_Absential_IsPresent);
