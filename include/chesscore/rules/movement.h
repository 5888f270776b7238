// include/chesscore/rules/movement.h
#ifndef CHESSCORE_MOVEMENT_H
#define CHESSCORE_MOVEMENT_H

#include <vector>
#include <utility>
#include "chesscore/core/board.h"

namespace chesscore {
namespace rules {

using MoveHistory = std::vector<core::PieceMove>;

/**
 * @brief Per-piece movement rules
 *
 * Every generator produces pseudo-legal destinations: it ignores whether
 * the move leaves the mover's own king in check. With
 * allowMoveOnAllyPositions set, the result is the set of squares the piece
 * protects or attacks, ally-occupied squares included; that variant feeds
 * the check detector. Castling is not generated here.
 */
class PieceMovement {
public:
    /**
     * @brief Pseudo-legal destinations of the piece on a square
     *
     * Dispatches on the piece kind found at @p from.
     *
     * @param board Board snapshot
     * @param from Square of the piece
     * @param history Moves played so far (en passant needs the last one)
     * @param allowMoveOnAllyPositions Include defended ally squares
     * @return Destinations; empty if @p from is invalid or empty
     */
    static std::vector<core::Coord> pseudoLegalMoves(
        const core::Board& board,
        const core::Coord& from,
        const MoveHistory& history,
        bool allowMoveOnAllyPositions);

    /**
     * @brief Squares the piece protects or attacks
     */
    static std::vector<core::Coord> protectedPositions(
        const core::Board& board,
        const core::Coord& from,
        const MoveHistory& history) {
        return pseudoLegalMoves(board, from, history, true);
    }

    static std::vector<core::Coord> pawnMoves(const core::Board& board, const core::Coord& from,
                                              core::PieceColor color, const MoveHistory& history,
                                              bool allowMoveOnAllyPositions);
    static std::vector<core::Coord> knightMoves(const core::Board& board, const core::Coord& from,
                                                core::PieceColor color, bool allowMoveOnAllyPositions);
    static std::vector<core::Coord> bishopMoves(const core::Board& board, const core::Coord& from,
                                                core::PieceColor color, bool allowMoveOnAllyPositions);
    static std::vector<core::Coord> rookMoves(const core::Board& board, const core::Coord& from,
                                              core::PieceColor color, bool allowMoveOnAllyPositions);
    static std::vector<core::Coord> queenMoves(const core::Board& board, const core::Coord& from,
                                               core::PieceColor color, bool allowMoveOnAllyPositions);
    static std::vector<core::Coord> kingMoves(const core::Board& board, const core::Coord& from,
                                              core::PieceColor color, bool allowMoveOnAllyPositions);

    /**
     * @brief Square an en passant capture would land on, if one is available
     */
    static std::optional<core::Coord> enPassantTarget(const core::Board& board, const core::Coord& from,
                                                      core::PieceColor color, const MoveHistory& history);

    /**
     * @brief Row direction pawns of a color advance in (-1 for White)
     */
    static int pawnDirection(core::PieceColor color) {
        return color == core::PieceColor::WHITE ? -1 : 1;
    }

    static int pawnStartRow(core::PieceColor color) {
        return color == core::PieceColor::WHITE ? 6 : 1;
    }

    static int promotionRow(core::PieceColor color) {
        return color == core::PieceColor::WHITE ? 0 : 7;
    }

private:
    static std::vector<core::Coord> slidingMoves(const core::Board& board, const core::Coord& from,
                                                 core::PieceColor color,
                                                 const std::vector<std::pair<int, int>>& directions,
                                                 bool allowMoveOnAllyPositions);
    static std::vector<core::Coord> stepMoves(const core::Board& board, const core::Coord& from,
                                              core::PieceColor color,
                                              const std::vector<std::pair<int, int>>& offsets,
                                              bool allowMoveOnAllyPositions);
};

} // namespace rules
} // namespace chesscore

#endif // CHESSCORE_MOVEMENT_H
