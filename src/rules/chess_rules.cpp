// src/rules/chess_rules.cpp
#include "chesscore/rules/chess_rules.h"
#include "chesscore/rules/check_detector.h"
#include "chesscore/rules/board_update.h"
#include <algorithm>

namespace chesscore {
namespace rules {

using core::Board;
using core::Coord;
using core::PieceColor;
using core::PieceType;

std::vector<Coord> ChessRules::legalMoves(
    const Board& board,
    const MoveHistory& history,
    const Coord& from) {

    auto piece = board.at(from);
    if (!piece) {
        return {};
    }

    std::vector<Coord> candidates = PieceMovement::pseudoLegalMoves(board, from, history, false);
    if (piece->type == PieceType::KING) {
        auto castling = castlingMoves(board, history, from);
        candidates.insert(candidates.end(), castling.begin(), castling.end());
    }

    std::vector<Coord> legal;
    legal.reserve(candidates.size());
    for (const auto& to : candidates) {
        if (!CheckDetector::leavesKingInCheck(board, history, from, to)) {
            legal.push_back(to);
        }
    }
    return legal;
}

std::vector<Coord> ChessRules::castlingMoves(
    const Board& board,
    const MoveHistory& history,
    const Coord& from) {

    std::vector<Coord> moves;
    auto king = board.at(from);
    if (!king || king->type != PieceType::KING) {
        return moves;
    }

    CastlingHome home = castlingHome(king->color);
    if (from != home.king) {
        return moves;
    }

    if (canCastle(board, history, king->color, true)) {
        moves.emplace_back(home.king.row, 6);
    }
    if (canCastle(board, history, king->color, false)) {
        moves.emplace_back(home.king.row, 2);
    }
    return moves;
}

bool ChessRules::canCastle(
    const Board& board,
    const MoveHistory& history,
    PieceColor color,
    bool kingside) {

    // (a) and (b)
    if (!hasCastlingRight(board, history, color, kingside)) {
        return false;
    }

    CastlingHome home = castlingHome(color);
    int row = home.king.row;
    Coord rook = kingside ? home.kingside_rook : home.queenside_rook;

    // (e) cells strictly between king and rook
    int low = std::min(home.king.col, rook.col) + 1;
    int high = std::max(home.king.col, rook.col);
    for (int col = low; col < high; ++col) {
        if (!board.isEmpty(Coord(row, col))) {
            return false;
        }
    }

    // (c) not castling out of check
    PieceColor opponent = core::oppositeColor(color);
    if (CheckDetector::isSquareAttacked(board, history, home.king, opponent)) {
        return false;
    }

    // (d) squares the king crosses or lands on
    const int path[2] = {kingside ? 5 : 3, kingside ? 6 : 2};
    for (int col : path) {
        if (CheckDetector::isSquareAttacked(board, history, Coord(row, col), opponent)) {
            return false;
        }
    }

    return true;
}

bool ChessRules::hasCastlingRight(
    const Board& board,
    const MoveHistory& history,
    PieceColor color,
    bool kingside) {

    CastlingHome home = castlingHome(color);
    Coord rook = kingside ? home.kingside_rook : home.queenside_rook;

    auto king = board.at(home.king);
    if (!king || king->type != PieceType::KING || king->color != color) {
        return false;
    }
    auto rookPiece = board.at(rook);
    if (!rookPiece || rookPiece->type != PieceType::ROOK || rookPiece->color != color) {
        return false;
    }

    return !didPieceAlreadyMove(history, PieceType::KING, color, home.king) &&
           !didPieceAlreadyMove(history, PieceType::ROOK, color, rook);
}

bool ChessRules::isLegalMove(
    const Board& board,
    const MoveHistory& history,
    const Coord& from,
    const Coord& to) {

    if (!from.isValid() || !to.isValid()) {
        return false;
    }

    Coord target = normalizeDestination(board, from, to);
    auto moves = legalMoves(board, history, from);
    return std::find(moves.begin(), moves.end(), target) != moves.end();
}

Coord ChessRules::normalizeDestination(
    const Board& board,
    const Coord& from,
    const Coord& to) {

    auto mover = board.at(from);
    auto target = board.at(to);
    if (!mover || !target || mover->type != PieceType::KING ||
        target->type != PieceType::ROOK || target->color != mover->color) {
        return to;
    }

    auto squares = BoardUpdate::castlingSquares(board, from, to);
    return squares ? squares->king_to : to;
}

int ChessRules::legalMoveCount(
    const Board& board,
    const MoveHistory& history,
    PieceColor color) {

    int count = 0;
    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        for (int col = 0; col < core::BOARD_SIZE; ++col) {
            Coord square(row, col);
            if (board.pieceColorAt(square) == color) {
                count += static_cast<int>(legalMoves(board, history, square).size());
            }
        }
    }
    return count;
}

bool ChessRules::didPieceAlreadyMove(
    const MoveHistory& history,
    PieceType type,
    PieceColor color,
    const Coord& home) {

    return std::any_of(history.begin(), history.end(), [&](const core::PieceMove& move) {
        return move.piece_type == type && move.piece_color == color && move.from == home;
    });
}

CastlingHome ChessRules::castlingHome(PieceColor color) {
    int row = color == PieceColor::WHITE ? 7 : 0;
    return CastlingHome{Coord(row, 4), Coord(row, 7), Coord(row, 0)};
}

} // namespace rules
} // namespace chesscore
