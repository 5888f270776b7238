// include/chesscore/notation/san.h
#ifndef CHESSCORE_SAN_H
#define CHESSCORE_SAN_H

#include <optional>
#include <string>
#include "chesscore/game/game_board.h"
#include "chesscore/notation/move_codec.h"

namespace chesscore {
namespace notation {

/**
 * @brief Standard Algebraic Notation
 */
class SanCodec {
public:
    /**
     * @brief Describe a legal move before it is played
     *
     * @param gameBoard Session in the position before the move
     * @param from Origin square
     * @param to Destination square
     * @param promotion Promotion kind for a pawn reaching its last row
     * @return SAN text such as "Nbd7", "exd5", "e8=Q+", "O-O"
     */
    static std::string toSan(
        const game::GameBoard& gameBoard,
        const core::Coord& from,
        const core::Coord& to,
        std::optional<core::PieceType> promotion = std::nullopt);

    /**
     * @brief Resolve a SAN token against the legal moves of a position
     *
     * Trailing check and annotation marks are ignored. Castling may be
     * written with letter O or digit 0.
     *
     * @param gameBoard Session in the current position
     * @param token SAN token
     * @param turn Side to move
     * @return The matching move
     * @throws core::PgnParseException if no legal move or more than one matches
     */
    static MoveText resolve(
        const game::GameBoard& gameBoard,
        const std::string& token,
        core::PieceColor turn);

    /**
     * @brief Remove trailing "+", "#", "!" and "?" marks
     */
    static std::string stripAnnotations(const std::string& token);
};

} // namespace notation
} // namespace chesscore

#endif // CHESSCORE_SAN_H
