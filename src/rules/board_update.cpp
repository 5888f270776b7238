// src/rules/board_update.cpp
#include "chesscore/rules/board_update.h"
#include <cstdlib>

namespace chesscore {
namespace rules {

using core::Board;
using core::Coord;
using core::PieceType;

bool BoardUpdate::isEnPassantShape(const Board& board, const Coord& from, const Coord& to) {
    if (board.pieceTypeAt(from) != PieceType::PAWN) {
        return false;
    }
    // Diagonal move onto an empty cell
    return from.row != to.row && from.col != to.col && board.isEmpty(to);
}

bool BoardUpdate::isCastlingShape(const Board& board, const Coord& from, const Coord& to) {
    auto king = board.at(from);
    if (!king || king->type != PieceType::KING || !to.isValid() || from.row != to.row) {
        return false;
    }

    if (std::abs(from.col - to.col) >= 2) {
        return true;
    }

    auto target = board.at(to);
    return target && target->type == PieceType::ROOK && target->color == king->color;
}

std::optional<CastlingSquares> BoardUpdate::castlingSquares(
    const Board& board, const Coord& from, const Coord& to) {

    if (!isCastlingShape(board, from, to)) {
        return std::nullopt;
    }

    auto king = board.at(from);
    bool kingside = to.col > from.col;
    int step = kingside ? 1 : -1;

    // The rook is the first piece beyond the king on that side
    Coord rookFrom = Coord::undefined();
    for (int col = from.col + step; col >= 0 && col < core::BOARD_SIZE; col += step) {
        auto piece = board.at(Coord(from.row, col));
        if (!piece) {
            continue;
        }
        if (piece->type == PieceType::ROOK && piece->color == king->color) {
            rookFrom = Coord(from.row, col);
        }
        break;
    }

    if (!rookFrom.isValid()) {
        return std::nullopt;
    }

    CastlingSquares squares;
    squares.king_to = Coord(from.row, kingside ? 6 : 2);
    squares.rook_from = rookFrom;
    squares.rook_to = Coord(from.row, kingside ? 5 : 3);
    return squares;
}

void BoardUpdate::apply(Board& board, const Coord& from, const Coord& to) {
    if (!from.isValid() || !to.isValid()) {
        return;
    }

    auto piece = board.at(from);
    if (!piece) {
        return;
    }

    if (auto castling = castlingSquares(board, from, to)) {
        auto rook = board.at(castling->rook_from);
        board.clear(castling->rook_from);
        board.clear(from);
        board.put(castling->king_to, piece);
        board.put(castling->rook_to, rook);
        return;
    }

    if (isEnPassantShape(board, from, to)) {
        board.clear(enPassantVictim(from, to));
    }

    board.put(to, piece);
    board.clear(from);
}

} // namespace rules
} // namespace chesscore
