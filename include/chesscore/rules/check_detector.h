// include/chesscore/rules/check_detector.h
#ifndef CHESSCORE_CHECK_DETECTOR_H
#define CHESSCORE_CHECK_DETECTOR_H

#include <set>
#include "chesscore/rules/movement.h"

namespace chesscore {
namespace rules {

/**
 * @brief King safety queries
 *
 * A square is attacked when it is in the protected set of any piece of the
 * opposing color. Legality filtering simulates the move on a copy of the
 * board and asks again, which also covers pins and moving into check.
 */
class CheckDetector {
public:
    /**
     * @brief Squares attacked by the opponent of a color
     *
     * @param board Board snapshot
     * @param history Move history
     * @param color The defending color
     * @return Union of the protected squares of every opposing piece
     */
    static std::set<core::Coord> attackedSquares(
        const core::Board& board,
        const MoveHistory& history,
        core::PieceColor color);

    /**
     * @brief Check if a square is attacked by a player
     *
     * @param board Board snapshot
     * @param history Move history
     * @param square Square to test
     * @param byColor Color of the attacker
     * @return true if attacked, false otherwise
     */
    static bool isSquareAttacked(
        const core::Board& board,
        const MoveHistory& history,
        const core::Coord& square,
        core::PieceColor byColor);

    /**
     * @brief Check if a color's king is attacked
     *
     * @return true if in check; false when the color has no king
     */
    static bool isInCheck(
        const core::Board& board,
        const MoveHistory& history,
        core::PieceColor color);

    /**
     * @brief Simulate a move and test the mover's king
     *
     * @param board Board before the move
     * @param history Move history before the move
     * @param from Origin of the move (must hold the mover's piece)
     * @param to Destination
     * @return true if the mover would be in check afterwards
     */
    static bool leavesKingInCheck(
        const core::Board& board,
        const MoveHistory& history,
        const core::Coord& from,
        const core::Coord& to);
};

} // namespace rules
} // namespace chesscore

#endif // CHESSCORE_CHECK_DETECTOR_H
