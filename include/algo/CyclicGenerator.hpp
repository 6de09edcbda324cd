#pragma once                              // ensure this header is included only once per translation unit

#include "square/LatinSquare.hpp"         // the value we build
#include "algo/InvalidInputError.hpp"     // the only failure surface
#include <algorithm>                      // std::find for the duplicate scan
#include <cstddef>                        // std::size_t
#include <utility>                        // std::move
#include <vector>                         // symbol sequences and rows

namespace latinsq {

/**
 * @brief Reject an unusable symbol set.
 *        Throws InvalidInputError (EmptyInput) for an empty vector and
 *        DuplicateSymbolError<Symbol> for the first symbol equal to an earlier one.
 *        Only Symbol::operator== is required, so the scan compares each symbol
 *        against its prefix.
 */
template <typename Symbol>
void validateSymbols(const std::vector<Symbol>& symbols) {
    if (symbols.empty()) throw InvalidInputError::emptyInput();   // n >= 1

    for (std::size_t i = 1; i < symbols.size(); ++i) {           // every symbol after the first
        auto end = symbols.begin() + static_cast<std::ptrdiff_t>(i);
        auto it = std::find(symbols.begin(), end, symbols[i]);    // seen before?
        if (it != end) {
            throw DuplicateSymbolError<Symbol>(symbols[i], i,
                    static_cast<std::size_t>(it - symbols.begin()));
        }
    }
}

/**
 * @brief Cyclic shift construction: row i is `symbols` rotated left by i,
 *        i.e. cell (i, j) holds symbols[(i + j) mod n].
 *        For a fixed column j, (i + j) mod n visits every residue once as i
 *        runs over 0..n-1, so columns are permutations as well as rows.
 *        Validation completes before the grid is allocated; on failure
 *        nothing is built.
 */
template <typename Symbol>
LatinSquare<Symbol> generate(const std::vector<Symbol>& symbols) {
    validateSymbols(symbols);                                     // fail fast, no partial output

    const std::size_t n = symbols.size();
    typename LatinSquare<Symbol>::Grid rows;
    rows.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {                         // row index
        typename LatinSquare<Symbol>::Row row;
        row.reserve(n);
        for (std::size_t j = 0; j < n; ++j)                       // column index
            row.push_back(symbols[(i + j) % n]);
        rows.push_back(std::move(row));
    }

    return LatinSquare<Symbol>(symbols, std::move(rows));         // copies symbols; caller keeps theirs
}

// Integer labels 1..n; generateCyclic(3) -> 1 2 3 / 2 3 1 / 3 1 2
LatinSquare<int> generateCyclic(std::size_t n);

} // namespace latinsq
