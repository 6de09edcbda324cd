// ==========================
// InvalidInputError.cpp
// ==========================
// Out-of-line pieces of InvalidInputError: message building and kind names.
// The typed DuplicateSymbolError<Symbol> stays in the header.
// ==========================

#include "algo/InvalidInputError.hpp"
#include <sstream>           // used for building the duplicate message

namespace latinsq {

InvalidInputError::InvalidInputError(Kind kind, const std::string& what,
                                     std::size_t index, std::size_t firstIndex)
    : std::invalid_argument(what), m_kind(kind), m_index(index), m_firstIndex(firstIndex) {}

InvalidInputError InvalidInputError::emptyInput() {
    return InvalidInputError(Kind::EmptyInput,
                             "empty symbol set: a Latin square needs at least one symbol",
                             0, 0);
}

std::string InvalidInputError::duplicateMessage(std::size_t index, std::size_t firstIndex) {
    std::ostringstream oss;
    oss << "duplicate symbol at index " << index
        << " (first seen at index " << firstIndex << ")";
    return oss.str();
}

const char* InvalidInputError::kindName(Kind kind) noexcept {
    switch (kind) {
        case Kind::EmptyInput:      return "EmptyInput";
        case Kind::DuplicateSymbol: return "DuplicateSymbol";
    }
    return "Unknown";
}

} // namespace latinsq
