#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>       // std::size_t for symbol positions
#include <stdexcept>     // std::invalid_argument base class
#include <string>        // std::string for messages
#include <utility>       // std::move

namespace latinsq {

// ==========================
// InvalidInputError
// ==========================
// The only failure of generate(): the symbol set was rejected before any row
// was built. Two sub-cases:
// - EmptyInput       n == 0
// - DuplicateSymbol  symbols[index()] == symbols[firstIndex()]; thrown as the
//                    typed DuplicateSymbolError<Symbol> below, which also
//                    carries the offending symbol
// ==========================

class InvalidInputError : public std::invalid_argument {
public:
    enum class Kind { EmptyInput, DuplicateSymbol };

    // Factory for the EmptyInput case
    static InvalidInputError emptyInput();

    Kind kind() const noexcept { return m_kind; }

    // Position of the rejected symbol (0 for EmptyInput)
    std::size_t index() const noexcept { return m_index; }

    // Position of the earlier, equal symbol (0 for EmptyInput)
    std::size_t firstIndex() const noexcept { return m_firstIndex; }

    // "EmptyInput" / "DuplicateSymbol"
    static const char* kindName(Kind kind) noexcept;

protected:
    InvalidInputError(Kind kind, const std::string& what,
                      std::size_t index, std::size_t firstIndex);

    // "duplicate symbol at index I (first seen at index J)"
    static std::string duplicateMessage(std::size_t index, std::size_t firstIndex);

private:
    Kind m_kind;
    std::size_t m_index;
    std::size_t m_firstIndex;
};

template <typename Symbol>
class DuplicateSymbolError : public InvalidInputError {
public:
    DuplicateSymbolError(Symbol symbol, std::size_t index, std::size_t firstIndex)
        : InvalidInputError(Kind::DuplicateSymbol, duplicateMessage(index, firstIndex),
                            index, firstIndex),
          m_symbol(std::move(symbol)) {}

    const Symbol& symbol() const noexcept { return m_symbol; }

private:
    Symbol m_symbol;
};

} // namespace latinsq
