//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include "gtest/gtest.h"
#include "absence/Cell.hpp"
#include "absence/Predicates.hpp"

using absence::Absential;
using absence::Cell;
using absence::EmptyCellError;

TEST(Cell, Empty) {
    auto cell = Cell<int>::empty();

    EXPECT_TRUE(cell.is_absent());
    EXPECT_FALSE(cell.is_occupied());
    EXPECT_FALSE(cell);
    EXPECT_TRUE(absence::is_absent(cell.value()));
}

TEST(Cell, DefaultConstructsEmpty) {
    Cell<std::string> cell;

    EXPECT_TRUE(cell.is_absent());
    EXPECT_EQ(cell, Cell<std::string>::empty());
}

TEST(Cell, Of) {
    auto cell = Cell<int>::of(42);

    EXPECT_TRUE(cell.is_occupied());
    EXPECT_FALSE(cell.is_absent());
    EXPECT_TRUE(cell);
    EXPECT_EQ(cell.extract(), 42);
    EXPECT_TRUE(absence::is_present(cell.value()));
}

TEST(Cell, OfFalseyValues) {
    EXPECT_TRUE(Cell<int>::of(0).is_occupied());
    EXPECT_TRUE(Cell<bool>::of(false).is_occupied());
    EXPECT_TRUE(Cell<std::string>::of("").is_occupied());
}

TEST(Cell, FromAbsential) {
    Absential<int> missing = absence::absent;
    Absential<int> supplied = 7;

    EXPECT_TRUE(Cell<int>::from_absential(missing).is_absent());
    EXPECT_EQ(Cell<int>::from_absential(supplied).extract(), 7);
    EXPECT_EQ(Cell<int>(supplied), Cell<int>::of(7));
}

TEST(Cell, FromNullable) {
    EXPECT_TRUE(Cell<int>::from_nullable(std::nullopt).is_absent());
    EXPECT_EQ(Cell<std::string>::from_nullable(std::string("hello")).extract(), "hello");
}

TEST(Cell, FromNullableNoneIsAbsent) {
    auto cell = Cell<int>::from_nullable(std::nullopt, true);
    EXPECT_TRUE(cell.is_absent());

    auto occupied = Cell<int>::from_nullable(3, true);
    ASSERT_TRUE(occupied.is_occupied());
    EXPECT_EQ(occupied.extract(), std::optional<int>(3));
}

TEST(Cell, FromNullableNoneIsValue) {
    auto cell = Cell<int>::from_nullable(std::nullopt, false);

    ASSERT_TRUE(cell.is_occupied());
    EXPECT_FALSE(cell.extract().has_value());
}

TEST(Cell, ExtractEmpty) {
    auto cell = Cell<int>::empty();

    try {
        cell.extract();
        FAIL() << "Expected call to throw.";
    } catch(EmptyCellError& error) {
        EXPECT_STREQ(error.what(), "Cannot extract from absent cell");
    }
}

TEST(Cell, ExtractMovesFromTemporary) {
    auto value = Cell<std::string>::of("moved").extract();
    EXPECT_EQ(value, "moved");

    EXPECT_THROW(Cell<std::string>::empty().extract(), EmptyCellError);
}

TEST(Cell, ExtractOr) {
    EXPECT_EQ(Cell<int>::empty().extract_or(7), 7);
    EXPECT_EQ(Cell<int>::of(42).extract_or(7), 42);
}

TEST(Cell, ExtractOrComputeEmpty) {
    int calls = 0;
    auto result = Cell<int>::empty().extract_or_compute([&calls]() {
        calls++;
        return 99;
    });

    EXPECT_EQ(result, 99);
    EXPECT_EQ(calls, 1);
}

TEST(Cell, ExtractOrComputeOccupied) {
    int calls = 0;
    auto result = Cell<int>::of(42).extract_or_compute([&calls]() {
        calls++;
        return 99;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 0);
}

TEST(Cell, EvaluateOr) {
    EXPECT_EQ(Cell<int>::of(42).evaluate_or([](int x) { return x + 1; }, -1), 43);
    EXPECT_EQ(Cell<int>::empty().evaluate_or([](int x) { return x + 1; }, -1), -1);
}

TEST(Cell, EvaluateOrSkipsEmpty) {
    bool called = false;
    auto result = Cell<int>::empty().evaluate_or([&called](int) {
        called = true;
        return std::string("called");
    }, std::string("fallback"));

    EXPECT_EQ(result, "fallback");
    EXPECT_FALSE(called);
}

TEST(Cell, EvaluateOrTrue) {
    auto fits = [](int columns) { return 80 <= columns; };

    EXPECT_TRUE(Cell<int>::empty().evaluate_or_true(fits));
    EXPECT_TRUE(Cell<int>::of(100).evaluate_or_true(fits));
    EXPECT_FALSE(Cell<int>::of(40).evaluate_or_true(fits));
}

TEST(Cell, EvaluateOrFalse) {
    auto fits = [](int columns) { return 80 <= columns; };

    EXPECT_FALSE(Cell<int>::empty().evaluate_or_false(fits));
    EXPECT_TRUE(Cell<int>::of(100).evaluate_or_false(fits));
    EXPECT_FALSE(Cell<int>::of(40).evaluate_or_false(fits));
}

TEST(Cell, Map) {
    EXPECT_EQ(Cell<int>::of(5).map([](int x) { return x * 2; }).extract(), 10);
}

TEST(Cell, MapChangesType) {
    auto cell = Cell<int>::of(5).map([](int x) { return std::to_string(x); });

    static_assert(std::is_same<decltype(cell), Cell<std::string>>::value, "map must produce a cell of the result type");
    EXPECT_EQ(cell.extract(), "5");
}

TEST(Cell, MapEmpty) {
    bool called = false;
    auto cell = Cell<int>::empty().map([&called](int x) {
        called = true;
        return x * 2;
    });

    EXPECT_EQ(cell, Cell<int>::empty());
    EXPECT_FALSE(called);
}

TEST(Cell, EvaluateOrAbsent) {
    EXPECT_EQ(Cell<int>::of(84).evaluate_or_absent([](int x) { return x / 2; }), Cell<int>::of(42));
    EXPECT_TRUE(Cell<int>::empty().evaluate_or_absent([](int x) { return x / 2; }).is_absent());
}

TEST(Cell, FlatMap) {
    auto cell = Cell<int>::of(5).flat_map([](int x) { return Cell<int>::of(x + 1); });
    EXPECT_EQ(cell, Cell<int>::of(6));
}

TEST(Cell, FlatMapToEmpty) {
    auto cell = Cell<int>::of(5).flat_map([](int) { return Cell<std::string>::empty(); });
    EXPECT_TRUE(cell.is_absent());
}

TEST(Cell, FlatMapEmpty) {
    bool called = false;
    auto cell = Cell<int>::empty().flat_map([&called](int x) {
        called = true;
        return Cell<int>::of(x + 1);
    });

    EXPECT_EQ(cell, Cell<int>::empty());
    EXPECT_FALSE(called);
}

TEST(Cell, FlatMapLeftIdentity) {
    auto f = [](int x) { return x > 0 ? Cell<int>::of(x * 3) : Cell<int>::empty(); };

    EXPECT_EQ(Cell<int>::of(4).flat_map(f), f(4));
    EXPECT_EQ(Cell<int>::of(-4).flat_map(f), f(-4));
}

TEST(Cell, FlatMapRightIdentity) {
    EXPECT_EQ(Cell<int>::of(4).flat_map(Cell<int>::of), Cell<int>::of(4));
    EXPECT_EQ(Cell<int>::empty().flat_map(Cell<int>::of), Cell<int>::empty());
}

TEST(Cell, OfAsFunction) {
    auto cell = Cell<int>::of(3).map([](int x) { return std::to_string(x); }).flat_map(Cell<std::string>::of);
    EXPECT_EQ(cell, Cell<std::string>::of("3"));
}

TEST(Cell, FlatMapAssociativity) {
    auto f = [](int x) { return Cell<int>::of(x + 1); };
    auto g = [](int x) { return x % 2 == 0 ? Cell<int>::of(x / 2) : Cell<int>::empty(); };

    for(auto start : {1, 2, 3}) {
        auto cell = Cell<int>::of(start);
        EXPECT_EQ(cell.flat_map(f).flat_map(g), cell.flat_map([&](int x) { return f(x).flat_map(g); }));
    }
}

TEST(Cell, Filter) {
    auto result = Cell<int>::of(100)
        .filter([](int x) { return x > 0; })
        .map([](int x) { return x - 4; })
        .extract_or(0);

    EXPECT_EQ(result, 96);
    EXPECT_TRUE(Cell<int>::of(-1).filter([](int x) { return x > 0; }).is_absent());
}

TEST(Cell, FilterEmpty) {
    bool called = false;
    auto cell = Cell<int>::empty().filter([&called](int) {
        called = true;
        return true;
    });

    EXPECT_TRUE(cell.is_absent());
    EXPECT_FALSE(called);
}

TEST(Cell, OrElse) {
    EXPECT_EQ(Cell<int>::empty().or_else(Cell<int>::of(10)).extract(), 10);
    EXPECT_EQ(Cell<int>::of(1).or_else(Cell<int>::of(10)).extract(), 1);
    EXPECT_TRUE(Cell<int>::empty().or_else(Cell<int>::empty()).is_absent());
}

TEST(Cell, OrElseChain) {
    auto user = Cell<int>::empty();
    auto system = Cell<int>::empty();
    auto builtin = Cell<int>::of(10);

    EXPECT_EQ(user.or_else(system).or_else(builtin).extract(), 10);
    EXPECT_EQ(Cell<int>::empty().or_else(Cell<int>::of(2)).or_else(Cell<int>::of(3)).extract(), 2);
}

TEST(Cell, OrCompute) {
    int calls = 0;
    auto factory = [&calls]() {
        calls++;
        return Cell<int>::of(10);
    };

    EXPECT_EQ(Cell<int>::empty().or_compute(factory).extract(), 10);
    EXPECT_EQ(calls, 1);

    EXPECT_EQ(Cell<int>::of(1).or_compute(factory).extract(), 1);
    EXPECT_EQ(calls, 1);
}

TEST(Cell, OrComputeShortCircuits) {
    int first_calls = 0;
    int second_calls = 0;

    auto cell = Cell<int>::empty()
        .or_compute([&first_calls]() {
            first_calls++;
            return Cell<int>::of(1);
        })
        .or_compute([&second_calls]() {
            second_calls++;
            return Cell<int>::of(2);
        });

    EXPECT_EQ(cell.extract(), 1);
    EXPECT_EQ(first_calls, 1);
    EXPECT_EQ(second_calls, 0);
}

TEST(Cell, ToNullable) {
    EXPECT_EQ(Cell<int>::of(42).to_nullable(), std::optional<int>(42));
    EXPECT_EQ(Cell<int>::empty().to_nullable(), std::nullopt);
}

TEST(Cell, NullableRoundTrip) {
    auto occupied = Cell<int>::of(42);
    auto empty = Cell<int>::empty();

    EXPECT_EQ(Cell<int>::from_nullable(occupied.to_nullable()), occupied);
    EXPECT_EQ(Cell<int>::from_nullable(empty.to_nullable()), empty);
}

TEST(Cell, Equality) {
    EXPECT_EQ(Cell<int>::empty(), Cell<int>::empty());
    EXPECT_EQ(Cell<int>::of(3), Cell<int>::of(3));
    EXPECT_NE(Cell<int>::of(3), Cell<int>::of(4));
    EXPECT_NE(Cell<int>::of(3), Cell<int>::empty());
    EXPECT_NE(Cell<int>::empty(), Cell<int>::of(3));
}

TEST(Cell, Hash) {
    std::hash<Cell<int>> hasher;

    EXPECT_EQ(hasher(Cell<int>::empty()), hasher(Cell<int>::empty()));
    EXPECT_EQ(hasher(Cell<int>::of(3)), hasher(Cell<int>::of(3)));
    EXPECT_EQ(hasher(Cell<int>::of(3)), std::hash<int>()(3));
    EXPECT_EQ(hasher(Cell<int>::empty()), std::hash<absence::Absent>()(absence::absent));
}

TEST(Cell, UsableAsKey) {
    std::unordered_set<Cell<std::string>> cells;
    cells.insert(Cell<std::string>::of("a"));
    cells.insert(Cell<std::string>::of("a"));
    cells.insert(Cell<std::string>::empty());
    cells.insert(Cell<std::string>::empty());

    EXPECT_EQ(cells.size(), 2);
}

TEST(Cell, CombinatorsLeaveSourceUntouched) {
    auto source = Cell<int>::of(5);

    source.map([](int x) { return x * 2; });
    source.filter([](int) { return false; });
    source.flat_map([](int) { return Cell<int>::empty(); });

    EXPECT_EQ(source, Cell<int>::of(5));
}

TEST(Cell, CallbackErrorsPropagate) {
    auto cell = Cell<int>::of(1);

    EXPECT_THROW(cell.map([](int) -> int { throw std::string("broke"); }), std::string);
    EXPECT_THROW(cell.filter([](int) -> bool { throw std::string("broke"); }), std::string);
    EXPECT_THROW(cell.evaluate_or([](int) -> int { throw std::string("broke"); }, 0), std::string);
    EXPECT_THROW(Cell<int>::empty().extract_or_compute([]() -> int { throw std::string("broke"); }), std::string);
    EXPECT_THROW(Cell<int>::empty().or_compute([]() -> Cell<int> { throw std::runtime_error("broke"); }), std::runtime_error);
}

TEST(Cell, Stream) {
    std::stringstream out;
    out << Cell<int>::of(42) << " " << Cell<int>::empty();
    EXPECT_EQ(out.str(), "Cell(42) Cell()");
}
