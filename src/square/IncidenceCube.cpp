// ==========================
// IncidenceCube.cpp
// ==========================
// Out-of-line members of IncidenceCube: construction of the cyclic cube,
// cell access, the properness check and label().
// The symbol-typed conversions are templates and stay in the header.
// ==========================

#include "square/IncidenceCube.hpp"
#include <sstream>           // used for building strings in label()

namespace latinsq {

IncidenceCube::IncidenceCube(std::size_t n)
    : m_n(n), m_cells(n * n * n, 0) {}

// --------------------------
// cyclic
// --------------------------
// Same square generate() builds for symbols 0..n-1, so
// cyclic(n).toLatinSquare(s) == generate(s) for any distinct s of length n.
IncidenceCube IncidenceCube::cyclic(std::size_t n) {
    if (n == 0) throw InvalidInputError::emptyInput();
    IncidenceCube cube(n);
    for (Index x = 0; x < n; ++x)
        for (Index y = 0; y < n; ++y)
            cube.m_cells[cube.offset(x, y, (x + y) % n)] = 1;
    return cube;
}

bool IncidenceCube::isOn(Index x, Index y, Index z) const {
    checkIndex(x);
    checkIndex(y);
    checkIndex(z);
    return m_cells[offset(x, y, z)] != 0;
}

void IncidenceCube::flip(Index x, Index y, Index z) {
    checkIndex(x);
    checkIndex(y);
    checkIndex(z);
    char& cell = m_cells[offset(x, y, z)];
    cell = cell ? 0 : 1;
}

std::size_t IncidenceCube::onCount() const noexcept {
    std::size_t count = 0;
    for (char c : m_cells)
        if (c) ++count;
    return count;
}

// --------------------------
// isProper
// --------------------------
// Every line along z (one symbol per cell), along y (one per row) and
// along x (one per column) must hold exactly one on cell.
bool IncidenceCube::isProper() const {
    for (Index a = 0; a < m_n; ++a) {
        for (Index b = 0; b < m_n; ++b) {
            std::size_t alongZ = 0, alongY = 0, alongX = 0;
            for (Index k = 0; k < m_n; ++k) {
                if (m_cells[offset(a, b, k)]) ++alongZ;   // cell (a,b) has one symbol
                if (m_cells[offset(a, k, b)]) ++alongY;   // row a has symbol b once
                if (m_cells[offset(k, a, b)]) ++alongX;   // column a has symbol b once
            }
            if (alongZ != 1 || alongY != 1 || alongX != 1) return false;
        }
    }
    return true;
}

IncidenceCube::Index IncidenceCube::symbolAt(Index x, Index y) const {
    checkIndex(x);
    checkIndex(y);
    Index found = m_n;
    for (Index z = 0; z < m_n; ++z) {
        if (!m_cells[offset(x, y, z)]) continue;
        if (found != m_n)
            throw std::logic_error("more than one symbol in incidence cube cell");
        found = z;
    }
    if (found == m_n)
        throw std::logic_error("no symbol in incidence cube cell");
    return found;
}

std::string IncidenceCube::label() const {
    std::ostringstream oss;
    oss << "IncidenceCube(" << m_n << "x" << m_n << "x" << m_n
        << ", " << onCount() << " on)";
    return oss.str();
}

void IncidenceCube::checkIndex(Index i) const {
    if (i >= m_n)
        throw std::out_of_range("incidence cube index out of range");
}

} // namespace latinsq
