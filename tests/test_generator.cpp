// ==========================
// tests/test_generator.cpp
// ==========================
// Unit tests for generate(), generateCyclic(), LatinSquare and the
// Latin property validator.
// Uses the doctest framework; this file produces its own main().
// ==========================

// Enable doctest main entry point (so this file produces a `main()`)
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"                 // doctest framework header

// Include project headers
#include "algo/CyclicGenerator.hpp"  // generate(), generateCyclic()
#include "algo/Validator.hpp"        // isLatinSquare(), isPermutationOf()

#include <sstream>                   // std::ostringstream for operator<<
#include <stdexcept>                 // std::invalid_argument, std::out_of_range
#include <string>                    // std::string
#include <vector>                    // std::vector

using namespace latinsq;

namespace {
// Symbol type with operator== only (no ordering, no hashing, no streaming)
struct Colour {
    int rgb;
    bool operator==(const Colour& o) const { return rgb == o.rgb; }
};
} // namespace

// ---------------------------
// Test 1: n=1 → single cell
// ---------------------------
TEST_CASE("Single symbol gives a 1x1 square") {
    auto sq = generate(std::vector<std::string>{"X"});
    REQUIRE(sq.order() == 1);
    CHECK(sq.rows() == std::vector<std::vector<std::string>>{{"X"}});
}

// ---------------------------
// Test 2: n=3 → rows are left rotations
// ---------------------------
TEST_CASE("Three letters rotate left by row index") {
    auto sq = generate(std::vector<std::string>{"A", "B", "C"});
    std::vector<std::vector<std::string>> want{
        {"A", "B", "C"},
        {"B", "C", "A"},
        {"C", "A", "B"}};
    CHECK(sq.rows() == want);
    CHECK(sq.at(2, 1) == "A");               // symbols[(2+1) mod 3]
}

// ---------------------------
// Test 3: n=4 → rows and column 0 spelled out
// ---------------------------
TEST_CASE("Order 4 over integers, column 0 is a permutation") {
    auto sq = generate(std::vector<int>{1, 2, 3, 4});
    CHECK(sq.row(0) == std::vector<int>{1, 2, 3, 4});
    CHECK(sq.row(1) == std::vector<int>{2, 3, 4, 1});
    CHECK(sq.row(2) == std::vector<int>{3, 4, 1, 2});
    CHECK(sq.row(3) == std::vector<int>{4, 1, 2, 3});
    CHECK(sq.column(0) == std::vector<int>{1, 2, 3, 4});
    CHECK(sq.column(3) == std::vector<int>{4, 1, 2, 3});
    CHECK(isPermutationOf(sq.column(0), sq.symbols()));
}

// ---------------------------
// Test 4: validity + dimension across many orders
// ---------------------------
TEST_CASE("Every order 1..12 yields an n x n Latin square") {
    for (std::size_t n = 1; n <= 12; ++n) {
        CAPTURE(n);
        auto sq = generateCyclic(n);
        REQUIRE(sq.order() == n);
        REQUIRE(sq.rows().size() == n);
        for (const auto& row : sq.rows()) CHECK(row.size() == n);
        for (std::size_t i = 0; i < n; ++i) {
            CHECK(isPermutationOf(sq.row(i), sq.symbols()));
            CHECK(isPermutationOf(sq.column(i), sq.symbols()));
        }
        CHECK(isLatinSquare(sq));
    }
}

// ---------------------------
// Test 5: determinism
// ---------------------------
TEST_CASE("Same input twice gives identical squares") {
    std::vector<char> symbols{'q', 'w', 'e', 'r', 't'};
    auto a = generate(symbols);
    auto b = generate(symbols);
    CHECK(a == b);
    CHECK_FALSE(a != b);
}

TEST_CASE("Different symbol order gives a different square") {
    auto a = generate(std::vector<int>{1, 2, 3});
    auto b = generate(std::vector<int>{2, 1, 3});
    CHECK(a != b);
}

// ---------------------------
// Test 6: generic over equality-only symbols
// ---------------------------
TEST_CASE("Symbol type needs only operator==") {
    std::vector<Colour> palette{{0xff0000}, {0x00ff00}, {0x0000ff}};
    auto sq = generate(palette);
    CHECK(sq.at(1, 2).rgb == 0xff0000);
    CHECK(isLatinSquare(sq));
}

// ---------------------------
// Test 7: caller data is not retained
// ---------------------------
TEST_CASE("Square does not alias the caller's vector") {
    std::vector<std::string> symbols{"x", "y"};
    auto sq = generate(symbols);
    symbols[0] = "changed";                    // mutate after return
    CHECK(sq.at(0, 0) == "x");
    CHECK(sq.symbols() == std::vector<std::string>{"x", "y"});
}

// ---------------------------
// Test 8: empty input
// ---------------------------
TEST_CASE("Empty symbol set is rejected as EmptyInput") {
    try {
        (void)generate(std::vector<int>{});
        FAIL("expected InvalidInputError");
    } catch (const InvalidInputError& e) {
        CHECK(e.kind() == InvalidInputError::Kind::EmptyInput);
        CHECK(std::string(e.what()).find("empty symbol set") != std::string::npos);
    }
    CHECK_THROWS_AS(generateCyclic(0), InvalidInputError);
    CHECK_THROWS_AS(generateCyclic(0), std::invalid_argument);   // base class
}

// ---------------------------
// Test 9: duplicate symbol
// ---------------------------
TEST_CASE("Repeated symbol is rejected as DuplicateSymbol carrying the symbol") {
    try {
        (void)generate(std::vector<std::string>{"A", "B", "A"});
        FAIL("expected DuplicateSymbolError");
    } catch (const DuplicateSymbolError<std::string>& e) {
        CHECK(e.kind() == InvalidInputError::Kind::DuplicateSymbol);
        CHECK(e.symbol() == "A");
        CHECK(e.index() == 2);
        CHECK(e.firstIndex() == 0);
        CHECK(std::string(e.what()) == "duplicate symbol at index 2 (first seen at index 0)");
    }
}

TEST_CASE("First repeat wins when several symbols repeat") {
    try {
        (void)generate(std::vector<int>{5, 6, 7, 6, 5});
        FAIL("expected DuplicateSymbolError");
    } catch (const DuplicateSymbolError<int>& e) {
        CHECK(e.symbol() == 6);
        CHECK(e.index() == 3);
        CHECK(e.firstIndex() == 1);
    }
}

TEST_CASE("Duplicate is catchable through the base class") {
    CHECK_THROWS_AS(generate(std::vector<char>{'a', 'a'}), InvalidInputError);
    CHECK_THROWS_WITH(generate(std::vector<char>{'a', 'b', 'b'}),
                      "duplicate symbol at index 2 (first seen at index 1)");
}

TEST_CASE("kindName() names both cases") {
    CHECK(std::string(InvalidInputError::kindName(InvalidInputError::Kind::EmptyInput)) == "EmptyInput");
    CHECK(std::string(InvalidInputError::kindName(InvalidInputError::Kind::DuplicateSymbol)) == "DuplicateSymbol");
}

// ---------------------------
// Test 10: accessors and label()
// ---------------------------
TEST_CASE("Accessors throw out_of_range past n-1") {
    auto sq = generateCyclic(3);
    CHECK_THROWS_AS((void)sq.row(3), std::out_of_range);
    CHECK_THROWS_AS((void)sq.column(3), std::out_of_range);
    CHECK_THROWS_AS((void)sq.at(0, 3), std::out_of_range);
    CHECK_THROWS_AS((void)sq.at(3, 0), std::out_of_range);
}

TEST_CASE("label() reports the dimensions") {
    CHECK(generateCyclic(4).label() == "LatinSquare(4x4)");
}

TEST_CASE("generateCyclic labels with 1..n") {
    auto sq = generateCyclic(3);
    CHECK(sq.symbols() == std::vector<int>{1, 2, 3});
    CHECK(sq.row(1) == std::vector<int>{2, 3, 1});
    CHECK(sq.row(2) == std::vector<int>{3, 1, 2});
}

// ---------------------------
// Test 11: printed form
// ---------------------------
TEST_CASE("operator<< prints header and rows separated by blank lines") {
    std::ostringstream oss;
    oss << generateCyclic(3);
    CHECK(oss.str() ==
          "Latin square of size 3\n\n"
          "1   2   3\n\n"
          "2   3   1\n\n"
          "3   1   2");
}

// ---------------------------
// Test 12: validator negatives
// ---------------------------
TEST_CASE("isLatinSquare rejects broken grids") {
    std::vector<int> s{1, 2, 3};

    std::vector<std::vector<int>> good{{1, 2, 3}, {2, 3, 1}, {3, 1, 2}};
    CHECK(isLatinSquare(good, s));

    std::vector<std::vector<int>> colRepeat{{1, 2, 3}, {1, 2, 3}, {3, 1, 2}};
    CHECK_FALSE(isLatinSquare(colRepeat, s));                   // rows fine, columns not

    std::vector<std::vector<int>> rowRepeat{{1, 1, 3}, {2, 3, 1}, {3, 2, 2}};
    CHECK_FALSE(isLatinSquare(rowRepeat, s));

    std::vector<std::vector<int>> foreign{{1, 2, 9}, {2, 9, 1}, {9, 1, 2}};
    CHECK_FALSE(isLatinSquare(foreign, s));

    std::vector<std::vector<int>> ragged{{1, 2, 3}, {2, 3}, {3, 1, 2}};
    CHECK_FALSE(isLatinSquare(ragged, s));

    std::vector<std::vector<int>> rectangle{{1, 2, 3}, {2, 3, 1}};
    CHECK_FALSE(isLatinSquare(rectangle, s));                   // Latin rectangle is not a square

    std::vector<std::vector<int>> none;
    CHECK_FALSE(isLatinSquare(none, std::vector<int>{}));

    std::vector<std::vector<int>> twoByTwo{{1, 1}, {1, 1}};
    CHECK_FALSE(isLatinSquare(twoByTwo, std::vector<int>{1, 1})); // duplicate symbol set
}
