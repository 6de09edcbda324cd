#pragma once                              // ensure this header is included only once per translation unit

#include "square/LatinSquare.hpp"         // conversion source/target
#include "algo/CyclicGenerator.hpp"       // validateSymbols() for toLatinSquare()
#include <algorithm>                      // std::find
#include <cstddef>                        // std::size_t
#include <stdexcept>                      // std::invalid_argument, std::logic_error
#include <string>                         // label()
#include <utility>                        // std::move
#include <vector>                         // cell storage

namespace latinsq {

// ==========================
// IncidenceCube
// ==========================
// Three-dimensional view of an order-n square: x = row, y = column,
// z = index of the symbol in the square's base order. Cell (x, y, z) is on
// iff the square holds symbol z at (x, y). For
//   0 1
//   1 0
// the on cells are (0,0,0), (0,1,1), (1,0,1), (1,1,0).
// A cube is "proper" when every axis-parallel line holds exactly one on cell,
// which is the Latin property restated in 3-D.
// Unlike LatinSquare the cube is a working representation and can be edited
// cell by cell with flip().
// ==========================

class IncidenceCube {
public:
    using Index = std::size_t;

    // ---- Builders ----

    // Cube of the cyclic square over indices 0..n-1 (cell (x, y, (x+y) mod n) on)
    static IncidenceCube cyclic(std::size_t n);

    // Cube of an existing square, using square.symbols() as the z axis
    template <typename Symbol>
    static IncidenceCube fromSquare(const LatinSquare<Symbol>& square);

    // ---- Public API ----

    std::size_t order() const noexcept { return m_n; }

    bool isOn(Index x, Index y, Index z) const;

    // Toggle one cell on/off
    void flip(Index x, Index y, Index z);

    // Number of on cells (n*n for a proper cube)
    std::size_t onCount() const noexcept;

    bool isProper() const;

    // z of the single on cell in line (x, y, *); throws std::logic_error if
    // that line does not hold exactly one on cell
    Index symbolAt(Index x, Index y) const;

    // Back to two dimensions, labelling z with symbols[z]
    template <typename Symbol>
    LatinSquare<Symbol> toLatinSquare(const std::vector<Symbol>& symbols) const;

    // "IncidenceCube(NxNxN, K on)"
    std::string label() const;

private:
    explicit IncidenceCube(std::size_t n);

    std::size_t m_n;                        // order
    std::vector<char> m_cells;              // n^3 flags, x-major then y then z

    std::size_t offset(Index x, Index y, Index z) const noexcept {
        return (x * m_n + y) * m_n + z;
    }

    // Helper: all three axes share the bound n
    void checkIndex(Index i) const;
};

template <typename Symbol>
IncidenceCube IncidenceCube::fromSquare(const LatinSquare<Symbol>& square) {
    const std::size_t n = square.order();
    if (n == 0) throw InvalidInputError::emptyInput();
    IncidenceCube cube(n);
    const auto& symbols = square.symbols();
    for (Index x = 0; x < n; ++x) {
        for (Index y = 0; y < n; ++y) {
            auto it = std::find(symbols.begin(), symbols.end(), square.at(x, y));
            if (it == symbols.end())              // cannot happen for a built square
                throw std::logic_error("square holds a symbol outside its base order");
            cube.m_cells[cube.offset(x, y, static_cast<Index>(it - symbols.begin()))] = 1;
        }
    }
    return cube;
}

template <typename Symbol>
LatinSquare<Symbol> IncidenceCube::toLatinSquare(const std::vector<Symbol>& symbols) const {
    validateSymbols(symbols);                                     // empty / duplicate labels
    if (symbols.size() != m_n)
        throw std::invalid_argument("symbol count does not match cube order");
    if (!isProper())
        throw std::logic_error("incidence cube is not proper; no Latin square to extract");

    typename LatinSquare<Symbol>::Grid rows(m_n);
    for (Index x = 0; x < m_n; ++x) {
        rows[x].reserve(m_n);
        for (Index y = 0; y < m_n; ++y)
            rows[x].push_back(symbols[symbolAt(x, y)]);
    }
    return LatinSquare<Symbol>(symbols, std::move(rows));
}

} // namespace latinsq
