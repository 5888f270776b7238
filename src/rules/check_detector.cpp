// src/rules/check_detector.cpp
#include "chesscore/rules/check_detector.h"
#include "chesscore/rules/board_update.h"
#include <algorithm>

namespace chesscore {
namespace rules {

using core::Board;
using core::Coord;
using core::PieceColor;

std::set<Coord> CheckDetector::attackedSquares(
    const Board& board,
    const MoveHistory& history,
    PieceColor color) {

    std::set<Coord> attacked;
    PieceColor attacker = core::oppositeColor(color);

    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        for (int col = 0; col < core::BOARD_SIZE; ++col) {
            Coord square(row, col);
            if (board.pieceColorAt(square) != attacker) {
                continue;
            }
            auto squares = PieceMovement::protectedPositions(board, square, history);
            attacked.insert(squares.begin(), squares.end());
        }
    }

    return attacked;
}

bool CheckDetector::isSquareAttacked(
    const Board& board,
    const MoveHistory& history,
    const Coord& square,
    PieceColor byColor) {

    if (!square.isValid()) {
        return false;
    }

    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        for (int col = 0; col < core::BOARD_SIZE; ++col) {
            Coord origin(row, col);
            if (board.pieceColorAt(origin) != byColor) {
                continue;
            }
            auto squares = PieceMovement::protectedPositions(board, origin, history);
            if (std::find(squares.begin(), squares.end(), square) != squares.end()) {
                return true;
            }
        }
    }

    return false;
}

bool CheckDetector::isInCheck(
    const Board& board,
    const MoveHistory& history,
    PieceColor color) {

    Coord king = board.kingCoordinates(color);
    if (!king.isValid()) {
        return false;
    }
    return isSquareAttacked(board, history, king, core::oppositeColor(color));
}

bool CheckDetector::leavesKingInCheck(
    const Board& board,
    const MoveHistory& history,
    const Coord& from,
    const Coord& to) {

    auto piece = board.at(from);
    if (!piece || !to.isValid()) {
        return false;
    }

    // Scratch copy; the real board is never touched
    Board simulated = board;
    BoardUpdate::apply(simulated, from, to);

    MoveHistory simulatedHistory = history;
    simulatedHistory.emplace_back(piece->type, piece->color, from, to);

    return isInCheck(simulated, simulatedHistory, piece->color);
}

} // namespace rules
} // namespace chesscore
