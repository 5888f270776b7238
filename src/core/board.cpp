// src/core/board.cpp
#include "chesscore/core/board.h"
#include <sstream>

namespace chesscore {
namespace core {

Board Board::initial() {
    Board board;

    const PieceType backRank[BOARD_SIZE] = {
        PieceType::ROOK, PieceType::KNIGHT, PieceType::BISHOP, PieceType::QUEEN,
        PieceType::KING, PieceType::BISHOP, PieceType::KNIGHT, PieceType::ROOK
    };

    for (int col = 0; col < BOARD_SIZE; ++col) {
        // Black back rank and pawns (ranks 8 and 7)
        board.set(Coord(0, col), {backRank[col], PieceColor::BLACK});
        board.set(Coord(1, col), {PieceType::PAWN, PieceColor::BLACK});

        // White pawns and back rank (ranks 2 and 1)
        board.set(Coord(6, col), {PieceType::PAWN, PieceColor::WHITE});
        board.set(Coord(7, col), {backRank[col], PieceColor::WHITE});
    }

    return board;
}

Board::Cell Board::at(const Coord& coord) const {
    if (!coord.isValid()) {
        return std::nullopt;
    }
    return cells_[coord.row][coord.col];
}

void Board::set(const Coord& coord, const Piece& piece) {
    put(coord, piece);
}

void Board::clear(const Coord& coord) {
    put(coord, std::nullopt);
}

void Board::put(const Coord& coord, const Cell& cell) {
    if (!coord.isValid()) {
        return;
    }
    cells_[coord.row][coord.col] = cell;
}

std::optional<PieceType> Board::pieceTypeAt(const Coord& coord) const {
    Cell cell = at(coord);
    if (!cell) {
        return std::nullopt;
    }
    return cell->type;
}

std::optional<PieceColor> Board::pieceColorAt(const Coord& coord) const {
    Cell cell = at(coord);
    if (!cell) {
        return std::nullopt;
    }
    return cell->color;
}

void Board::flip() {
    *this = flipped();
}

Board Board::flipped() const {
    Board result;
    for (int row = 0; row < BOARD_SIZE; ++row) {
        for (int col = 0; col < BOARD_SIZE; ++col) {
            // Place each square in the mirrored position
            result.cells_[BOARD_SIZE - 1 - row][BOARD_SIZE - 1 - col] = cells_[row][col];
        }
    }
    return result;
}

Coord Board::kingCoordinates(PieceColor color) const {
    for (int row = 0; row < BOARD_SIZE; ++row) {
        for (int col = 0; col < BOARD_SIZE; ++col) {
            const Cell& cell = cells_[row][col];
            if (cell && cell->type == PieceType::KING && cell->color == color) {
                return Coord(row, col);
            }
        }
    }
    return Coord::undefined();
}

int Board::pieceCount() const {
    int count = 0;
    for (const auto& row : cells_) {
        for (const auto& cell : row) {
            if (cell) {
                count++;
            }
        }
    }
    return count;
}

std::string Board::toString() const {
    std::stringstream ss;

    ss << "  a b c d e f g h" << std::endl;
    for (int row = 0; row < BOARD_SIZE; ++row) {
        ss << (BOARD_SIZE - row) << " ";
        for (int col = 0; col < BOARD_SIZE; ++col) {
            const Cell& cell = cells_[row][col];
            ss << (cell ? pieceToFenChar(*cell) : '.') << " ";
        }
        ss << (BOARD_SIZE - row) << std::endl;
    }
    ss << "  a b c d e f g h" << std::endl;

    return ss.str();
}

} // namespace core
} // namespace chesscore
