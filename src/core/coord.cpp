// src/core/coord.cpp
#include "chesscore/core/coord.h"

namespace chesscore {
namespace core {

std::optional<Coord> Coord::make(int row, int col) {
    Coord coord(row, col);
    if (!coord.isValid()) {
        return std::nullopt;
    }
    return coord;
}

Coord Coord::flipped() const {
    if (!isValid()) {
        return *this;
    }
    return Coord(BOARD_SIZE - 1 - row, BOARD_SIZE - 1 - col);
}

std::string Coord::toAlgebraic() const {
    if (!isValid()) {
        return "";
    }

    char fileChar = static_cast<char>('a' + col);
    char rankChar = static_cast<char>('8' - row);

    return std::string({fileChar, rankChar});
}

std::optional<Coord> Coord::fromAlgebraic(const std::string& text) {
    if (text.length() != 2) {
        return std::nullopt;
    }

    char fileChar = text[0];
    char rankChar = text[1];

    if (fileChar < 'a' || fileChar > 'h' || rankChar < '1' || rankChar > '8') {
        return std::nullopt;
    }

    return Coord('8' - rankChar, fileChar - 'a');
}

} // namespace core
} // namespace chesscore
