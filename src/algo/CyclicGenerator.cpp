// ==========================
// CyclicGenerator.cpp
// ==========================
// generate() itself is a template and lives in the header; this file holds
// the non-template convenience entry point over integer labels.
// ==========================

#include "algo/CyclicGenerator.hpp"

namespace latinsq {

LatinSquare<int> generateCyclic(std::size_t n) {
    std::vector<int> labels;
    labels.reserve(n);
    for (std::size_t k = 1; k <= n; ++k)
        labels.push_back(static_cast<int>(k));
    return generate(labels);                  // n == 0 -> InvalidInputError (EmptyInput)
}

} // namespace latinsq
