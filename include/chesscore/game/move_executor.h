// include/chesscore/game/move_executor.h
#ifndef CHESSCORE_MOVE_EXECUTOR_H
#define CHESSCORE_MOVE_EXECUTOR_H

#include <optional>
#include "chesscore/game/game_board.h"

namespace chesscore {
namespace game {

/**
 * @brief Applies moves to a game session
 *
 * The executor trusts its input: legality is decided upstream by only
 * offering legal destinations.
 */
class MoveExecutor {
public:
    /**
     * @brief Execute a move and append it to the histories
     *
     * In order: update the fifty-move counter, record a captured enemy,
     * remove an en passant victim, relocate the rook of a castling move,
     * move the piece, append to move and position history. If the session
     * is viewing an earlier position, the history is truncated there first.
     *
     * @param gameBoard Session to update
     * @param from Origin square
     * @param to Destination square; for castling either the king's landing
     *        square or the rook's square
     * @return The recorded move, or empty if a coordinate is invalid or
     *         @p from is empty
     */
    static std::optional<core::PieceMove> execute(
        GameBoard& gameBoard,
        const core::Coord& from,
        const core::Coord& to);

    /**
     * @brief Replace the pawn of a pending promotion
     *
     * @param gameBoard Session whose latest move is a pending promotion
     * @param type Queen, rook, bishop or knight
     * @return false if nothing is pending or @p type is not a promotion kind
     */
    static bool promote(GameBoard& gameBoard, core::PieceType type);

    /**
     * @brief Board-only part of a move, no history or counters
     */
    static void applyToBoard(core::Board& board, const core::Coord& from, const core::Coord& to);
};

} // namespace game
} // namespace chesscore

#endif // CHESSCORE_MOVE_EXECUTOR_H
