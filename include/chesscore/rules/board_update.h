// include/chesscore/rules/board_update.h
#ifndef CHESSCORE_BOARD_UPDATE_H
#define CHESSCORE_BOARD_UPDATE_H

#include <optional>
#include "chesscore/core/board.h"

namespace chesscore {
namespace rules {

/**
 * @brief Where king and rook end up for one castling move
 */
struct CastlingSquares {
    core::Coord king_to;
    core::Coord rook_from;
    core::Coord rook_to;
};

/**
 * @brief Board-only application of a move
 *
 * Recognizes the en passant and castling shapes and relocates the extra
 * piece they involve. Nothing here checks legality or touches history; it is
 * shared by the move executor and by the check simulation.
 */
class BoardUpdate {
public:
    /**
     * @brief Pawn moving diagonally onto an empty square
     */
    static bool isEnPassantShape(const core::Board& board, const core::Coord& from, const core::Coord& to);

    /**
     * @brief King moving two or more files, or onto one of its own rooks
     */
    static bool isCastlingShape(const core::Board& board, const core::Coord& from, const core::Coord& to);

    /**
     * @brief Resolve the king and rook squares of a castling move
     *
     * Both encodings (king to its landing square, or king to the rook
     * square) give the same result. The king lands on file g or c and the
     * rook next to it on the side it came from.
     *
     * @return Squares, or empty if the move is not a castling move or there
     *         is no rook of the king's color on that side
     */
    static std::optional<CastlingSquares> castlingSquares(
        const core::Board& board, const core::Coord& from, const core::Coord& to);

    /**
     * @brief Square of the pawn removed by an en passant capture
     */
    static core::Coord enPassantVictim(const core::Coord& from, const core::Coord& to) {
        return core::Coord(from.row, to.col);
    }

    /**
     * @brief Apply a move to the board
     *
     * Does nothing if either coordinate is invalid or @p from is empty.
     */
    static void apply(core::Board& board, const core::Coord& from, const core::Coord& to);
};

} // namespace rules
} // namespace chesscore

#endif // CHESSCORE_BOARD_UPDATE_H
