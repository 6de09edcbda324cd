#pragma once                              // ensure this header is included only once per translation unit

#include "square/LatinSquare.hpp"         // overload for finished squares
#include <algorithm>                      // std::find
#include <cstddef>                        // std::size_t
#include <vector>                         // grids, lines and seen flags

namespace latinsq {

// ==========================
// Latin property checks
// ==========================
// Independent re-check of a grid against a symbol set. Never throws; any
// shape or content problem just yields false. Only operator== on Symbol is
// needed, so membership is a linear search in `symbols`.
// ==========================

// True if `line` holds every element of `symbols` exactly once
template <typename Symbol>
bool isPermutationOf(const std::vector<Symbol>& line, const std::vector<Symbol>& symbols) {
    if (line.size() != symbols.size()) return false;
    std::vector<bool> seen(symbols.size(), false);
    for (const auto& s : line) {
        auto it = std::find(symbols.begin(), symbols.end(), s);
        if (it == symbols.end()) return false;                    // foreign symbol
        auto k = static_cast<std::size_t>(it - symbols.begin());
        if (seen[k]) return false;                                // repeated in this line
        seen[k] = true;
    }
    return true;
}

// True if `rows` is n x n (n = symbols.size() >= 1), `symbols` is distinct,
// and every row and every column is a permutation of `symbols`
template <typename Symbol>
bool isLatinSquare(const std::vector<std::vector<Symbol>>& rows,
                   const std::vector<Symbol>& symbols) {
    const std::size_t n = symbols.size();
    if (n == 0 || rows.size() != n) return false;
    if (!isPermutationOf(symbols, symbols)) return false;         // duplicate in the symbol set itself

    for (const auto& row : rows)
        if (!isPermutationOf(row, symbols)) return false;         // also rejects ragged rows

    std::vector<Symbol> col;
    col.reserve(n);
    for (std::size_t c = 0; c < n; ++c) {
        col.clear();
        for (std::size_t r = 0; r < n; ++r) col.push_back(rows[r][c]);
        if (!isPermutationOf(col, symbols)) return false;
    }
    return true;
}

template <typename Symbol>
bool isLatinSquare(const LatinSquare<Symbol>& square) {
    return isLatinSquare(square.rows(), square.symbols());
}

} // namespace latinsq
