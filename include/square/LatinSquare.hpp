#pragma once                              // ensure this header is included only once per translation unit

#include <vector>        // rows and the base symbol order
#include <cstddef>       // defines std::size_t type
#include <stdexcept>     // std::out_of_range for bad row/column indices
#include <string>        // used for std::string in label()
#include <sstream>       // used for building strings in label()
#include <ostream>       // operator<< rendering
#include <utility>       // std::move

namespace latinsq {

// ==========================
// LatinSquare<Symbol>
// ==========================
// An n x n grid of n symbols where every symbol appears exactly once per row
// and exactly once per column.
// - Built only by generate() (algo/CyclicGenerator.hpp) or by
//   IncidenceCube::toLatinSquare(); never mutated afterwards
// - Owns its cells; holds no reference to the caller's symbol vector
// - Remembers the base symbol order it was built from (used as the symbol
//   axis by IncidenceCube::fromSquare)
// Symbol only needs operator== for the square itself; operator<< is needed
// only when the square is printed.
// ==========================

class IncidenceCube;

template <typename Symbol>
class LatinSquare {
public:
    // Type aliases for readability
    using Row  = std::vector<Symbol>;       // one row (or one column copy)
    using Grid = std::vector<Row>;          // rows in index order

    // ---- Public API ----

    // Return n, the number of rows (== columns == distinct symbols)
    std::size_t order() const noexcept { return m_rows.size(); }

    // Base symbol order; row 0 of a generated square equals this sequence
    const Row& symbols() const noexcept { return m_symbols; }

    // Whole grid, row-major
    const Grid& rows() const noexcept { return m_rows; }

    // Access row `r`
    const Row& row(std::size_t r) const {
        checkIndex(r);
        return m_rows[r];
    }

    // Copy out column `c` (top to bottom)
    Row column(std::size_t c) const {
        checkIndex(c);
        Row col;
        col.reserve(order());
        for (const auto& r : m_rows) col.push_back(r[c]);
        return col;
    }

    // Symbol at row `r`, column `c`
    const Symbol& at(std::size_t r, std::size_t c) const {
        checkIndex(r);
        checkIndex(c);
        return m_rows[r][c];
    }

    // Human-readable summary: "LatinSquare(NxN)"
    std::string label() const {
        std::ostringstream oss;
        oss << "LatinSquare(" << order() << "x" << order() << ")";
        return oss.str();
    }

    friend bool operator==(const LatinSquare& a, const LatinSquare& b) {
        return a.m_rows == b.m_rows;
    }

    friend bool operator!=(const LatinSquare& a, const LatinSquare& b) {
        return !(a == b);
    }

private:
    // Builders (see class comment)
    template <typename S>
    friend LatinSquare<S> generate(const std::vector<S>& symbols);
    friend class IncidenceCube;

    LatinSquare(Row symbols, Grid rows)
        : m_symbols(std::move(symbols)), m_rows(std::move(rows)) {}

    Row  m_symbols;                         // base order, length n
    Grid m_rows;                            // n rows of n symbols

    // Helper: row and column indices share the same bound
    void checkIndex(std::size_t i) const {
        if (i >= m_rows.size())
            throw std::out_of_range("row/column index out of range");
    }
}; // end class LatinSquare

// --------------------------
// operator<<
// --------------------------
// Format:
//   Latin square of size N
//   <blank line>
//   s00   s01   s02
//   <blank line>
//   s10   s11   s12
//   ...
// Symbols are separated by three spaces, rows by an empty line. No trailing
// newline after the last row.
template <typename Symbol>
std::ostream& operator<<(std::ostream& out, const LatinSquare<Symbol>& square) {
    out << "Latin square of size " << square.order() << "\n\n";
    const auto& rows = square.rows();
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) out << "\n\n";
        for (std::size_t j = 0; j < rows[i].size(); ++j) {
            if (j > 0) out << "   ";
            out << rows[i][j];
        }
    }
    return out;
}

} // namespace latinsq
