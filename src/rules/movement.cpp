// src/rules/movement.cpp
#include "chesscore/rules/movement.h"
#include <cstdlib>

namespace chesscore {
namespace rules {

using core::Board;
using core::Coord;
using core::PieceColor;
using core::PieceType;

// Helper constant arrays for knight and king moves
const std::vector<std::pair<int, int>> KNIGHT_MOVES = {
    {-2, -1}, {-2, 1}, {-1, -2}, {-1, 2}, {1, -2}, {1, 2}, {2, -1}, {2, 1}
};

const std::vector<std::pair<int, int>> KING_MOVES = {
    {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}
};

// Sliding piece directions (bishop, rook, queen)
const std::vector<std::pair<int, int>> BISHOP_DIRECTIONS = {
    {-1, -1}, {-1, 1}, {1, -1}, {1, 1}
};

const std::vector<std::pair<int, int>> ROOK_DIRECTIONS = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}
};

const std::vector<std::pair<int, int>> QUEEN_DIRECTIONS = {
    {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}
};

std::vector<Coord> PieceMovement::pseudoLegalMoves(
    const Board& board,
    const Coord& from,
    const MoveHistory& history,
    bool allowMoveOnAllyPositions) {

    auto piece = board.at(from);
    if (!piece) {
        return {};
    }

    switch (piece->type) {
        case PieceType::PAWN:
            return pawnMoves(board, from, piece->color, history, allowMoveOnAllyPositions);
        case PieceType::KNIGHT:
            return knightMoves(board, from, piece->color, allowMoveOnAllyPositions);
        case PieceType::BISHOP:
            return bishopMoves(board, from, piece->color, allowMoveOnAllyPositions);
        case PieceType::ROOK:
            return rookMoves(board, from, piece->color, allowMoveOnAllyPositions);
        case PieceType::QUEEN:
            return queenMoves(board, from, piece->color, allowMoveOnAllyPositions);
        case PieceType::KING:
            return kingMoves(board, from, piece->color, allowMoveOnAllyPositions);
    }
    return {};
}

std::vector<Coord> PieceMovement::pawnMoves(const Board& board, const Coord& from,
                                            PieceColor color, const MoveHistory& history,
                                            bool allowMoveOnAllyPositions) {
    std::vector<Coord> moves;
    int direction = pawnDirection(color);

    // Protected squares are the two diagonals, whatever stands on them
    if (allowMoveOnAllyPositions) {
        for (int colOffset : {-1, 1}) {
            Coord diagonal(from.row + direction, from.col + colOffset);
            if (diagonal.isValid()) {
                moves.push_back(diagonal);
            }
        }
        return moves;
    }

    // Regular move forward
    Coord oneForward(from.row + direction, from.col);
    if (oneForward.isValid() && board.isEmpty(oneForward)) {
        moves.push_back(oneForward);

        // Initial two-square move
        Coord twoForward(from.row + 2 * direction, from.col);
        if (from.row == pawnStartRow(color) && twoForward.isValid() && board.isEmpty(twoForward)) {
            moves.push_back(twoForward);
        }
    }

    // Captures
    for (int colOffset : {-1, 1}) {
        Coord diagonal(from.row + direction, from.col + colOffset);
        auto target = board.at(diagonal);
        if (target && target->color != color) {
            moves.push_back(diagonal);
        }
    }

    if (auto enPassant = enPassantTarget(board, from, color, history)) {
        moves.push_back(*enPassant);
    }

    return moves;
}

std::optional<Coord> PieceMovement::enPassantTarget(const Board& board, const Coord& from,
                                                    PieceColor color, const MoveHistory& history) {
    if (history.empty()) {
        return std::nullopt;
    }

    const core::PieceMove& last = history.back();
    if (last.piece_type != PieceType::PAWN || last.piece_color == color) {
        return std::nullopt;
    }

    // Two-cell advance landing right next to this pawn
    if (std::abs(last.from.row - last.to.row) != 2 || last.to.row != from.row ||
        std::abs(last.to.col - from.col) != 1) {
        return std::nullopt;
    }

    auto passed = board.at(last.to);
    if (!passed || passed->type != PieceType::PAWN || passed->color == color) {
        return std::nullopt;
    }

    Coord target(from.row + pawnDirection(color), last.to.col);
    if (!target.isValid() || !board.isEmpty(target)) {
        return std::nullopt;
    }
    return target;
}

std::vector<Coord> PieceMovement::knightMoves(const Board& board, const Coord& from,
                                              PieceColor color, bool allowMoveOnAllyPositions) {
    return stepMoves(board, from, color, KNIGHT_MOVES, allowMoveOnAllyPositions);
}

std::vector<Coord> PieceMovement::bishopMoves(const Board& board, const Coord& from,
                                              PieceColor color, bool allowMoveOnAllyPositions) {
    return slidingMoves(board, from, color, BISHOP_DIRECTIONS, allowMoveOnAllyPositions);
}

std::vector<Coord> PieceMovement::rookMoves(const Board& board, const Coord& from,
                                            PieceColor color, bool allowMoveOnAllyPositions) {
    return slidingMoves(board, from, color, ROOK_DIRECTIONS, allowMoveOnAllyPositions);
}

std::vector<Coord> PieceMovement::queenMoves(const Board& board, const Coord& from,
                                             PieceColor color, bool allowMoveOnAllyPositions) {
    return slidingMoves(board, from, color, QUEEN_DIRECTIONS, allowMoveOnAllyPositions);
}

std::vector<Coord> PieceMovement::kingMoves(const Board& board, const Coord& from,
                                            PieceColor color, bool allowMoveOnAllyPositions) {
    return stepMoves(board, from, color, KING_MOVES, allowMoveOnAllyPositions);
}

std::vector<Coord> PieceMovement::slidingMoves(const Board& board, const Coord& from,
                                               PieceColor color,
                                               const std::vector<std::pair<int, int>>& directions,
                                               bool allowMoveOnAllyPositions) {
    std::vector<Coord> moves;

    for (const auto& [rowDir, colDir] : directions) {
        for (int step = 1; ; ++step) {
            Coord target(from.row + rowDir * step, from.col + colDir * step);

            if (!target.isValid()) {
                break;  // Off the board
            }

            auto targetPiece = board.at(target);

            if (!targetPiece) {
                // Empty square, can move here
                moves.push_back(target);
            } else if (targetPiece->color != color) {
                // Capture opponent's piece
                moves.push_back(target);
                break;  // Can't move beyond this
            } else {
                // Own piece: defended, but nothing beyond it
                if (allowMoveOnAllyPositions) {
                    moves.push_back(target);
                }
                break;
            }
        }
    }

    return moves;
}

std::vector<Coord> PieceMovement::stepMoves(const Board& board, const Coord& from,
                                            PieceColor color,
                                            const std::vector<std::pair<int, int>>& offsets,
                                            bool allowMoveOnAllyPositions) {
    std::vector<Coord> moves;

    for (const auto& [rowOffset, colOffset] : offsets) {
        Coord target(from.row + rowOffset, from.col + colOffset);
        if (!target.isValid()) {
            continue;
        }

        auto targetPiece = board.at(target);
        if (targetPiece && targetPiece->color == color && !allowMoveOnAllyPositions) {
            continue;
        }
        moves.push_back(target);
    }

    return moves;
}

} // namespace rules
} // namespace chesscore
