// include/chesscore/rules/chess_rules.h
#ifndef CHESSCORE_CHESS_RULES_H
#define CHESSCORE_CHESS_RULES_H

#include <vector>
#include "chesscore/rules/movement.h"

namespace chesscore {
namespace rules {

/**
 * @brief Home squares of the pieces that take part in castling
 */
struct CastlingHome {
    core::Coord king;
    core::Coord kingside_rook;
    core::Coord queenside_rook;
};

/**
 * @brief Rules implementation for Chess
 *
 * Stateless: every query takes the board snapshot and the move history it
 * applies to.
 */
class ChessRules {
public:
    /**
     * @brief Legal destinations of the piece on a square
     *
     * Pseudo-legal moves without ally destinations, plus castling landing
     * squares for an unmoved king, minus every move that would leave the
     * mover's king in check.
     *
     * @param board Board snapshot
     * @param history Move history
     * @param from Square of the piece
     * @return Destinations; empty if @p from is invalid or empty
     */
    static std::vector<core::Coord> legalMoves(
        const core::Board& board,
        const MoveHistory& history,
        const core::Coord& from);

    /**
     * @brief Castling landing squares available to the king on a square
     *
     * Castling requires that (a) the king has never left its home square,
     * (b) the rook is on its home square and has never left it, (c) the king
     * is not in check, (d) no square the king crosses or lands on is
     * attacked and (e) every cell between king and rook is empty.
     *
     * @return King landing squares (file g and/or file c)
     */
    static std::vector<core::Coord> castlingMoves(
        const core::Board& board,
        const MoveHistory& history,
        const core::Coord& from);

    /**
     * @brief Check if a move is legal
     *
     * A king move onto its own rook is read as the matching castling move.
     */
    static bool isLegalMove(
        const core::Board& board,
        const MoveHistory& history,
        const core::Coord& from,
        const core::Coord& to);

    /**
     * @brief Map the king-onto-rook castling encoding to the king's landing square
     *
     * @return @p to unchanged for every other move
     */
    static core::Coord normalizeDestination(
        const core::Board& board,
        const core::Coord& from,
        const core::Coord& to);

    /**
     * @brief Total number of legal moves for a color
     */
    static int legalMoveCount(
        const core::Board& board,
        const MoveHistory& history,
        core::PieceColor color);

    /**
     * @brief Whether a piece has ever moved away from a square
     *
     * @param history Move history
     * @param type Piece kind
     * @param color Piece color
     * @param home Square the piece started on
     * @return true if some history record moved that piece off @p home
     */
    static bool didPieceAlreadyMove(
        const MoveHistory& history,
        core::PieceType type,
        core::PieceColor color,
        const core::Coord& home);

    static CastlingHome castlingHome(core::PieceColor color);

    /**
     * @brief Whether castling on one side is still possible in principle
     *
     * Only conditions (a) and (b) are tested; used for FEN castling rights.
     */
    static bool hasCastlingRight(
        const core::Board& board,
        const MoveHistory& history,
        core::PieceColor color,
        bool kingside);

private:
    static bool canCastle(
        const core::Board& board,
        const MoveHistory& history,
        core::PieceColor color,
        bool kingside);
};

} // namespace rules
} // namespace chesscore

#endif // CHESSCORE_CHESS_RULES_H
