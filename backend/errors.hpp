#ifndef GAMBIT_ERRORS_HPP
#define GAMBIT_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace gambit {

// Every rejected operation leaves the board and the session untouched.
class ChessError : public std::runtime_error {
public:
    explicit ChessError(const std::string& what) : std::runtime_error(what) {}
};

class InvalidSquare : public ChessError {
public:
    InvalidSquare(int row, int col)
        : ChessError("Invalid square: (" + std::to_string(row) + ", " + std::to_string(col) + ")") {}
};

class IllegalMove : public ChessError {
public:
    explicit IllegalMove(const Move& m)
        : ChessError("Illegal move: " + moveToString(m)) {}
    explicit IllegalMove(const std::string& what) : ChessError(what) {}
};

class NoActiveSelection : public ChessError {
public:
    NoActiveSelection() : ChessError("No piece is selected") {}
};

class EmptyHistory : public ChessError {
public:
    EmptyHistory() : ChessError("No move to undo") {}
};

} // namespace gambit

#endif // GAMBIT_ERRORS_HPP
