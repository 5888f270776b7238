// include/chesscore/notation/move_codec.h
#ifndef CHESSCORE_MOVE_CODEC_H
#define CHESSCORE_MOVE_CODEC_H

#include <optional>
#include <string>
#include "chesscore/core/piece.h"

namespace chesscore {
namespace notation {

/**
 * @brief A move as exchanged with the outside world
 */
struct MoveText {
    core::Coord from;
    core::Coord to;
    std::optional<core::PieceType> promotion;
};

/**
 * @brief Move texts used at the engine and network boundaries
 *
 * Engine moves are long algebraic: "e2e4", "e7e8q".
 * Network tokens are the four board indices "from.row from.col to.row
 * to.col" with an optional promotion letter: "6444", "1404q". The literal
 * "ended" means the peer ended the game.
 */
class MoveCodec {
public:
    static const std::string END_TOKEN;

    /**
     * @brief Parse an engine move
     *
     * Surrounding whitespace is ignored.
     *
     * @return The move, or empty if the text is malformed
     */
    static std::optional<MoveText> parseEngineMove(const std::string& text);

    static std::string formatEngineMove(const MoveText& move);

    /**
     * @brief Parse a network move token
     *
     * @return The move, or empty if the token is malformed (including "ended")
     */
    static std::optional<MoveText> parseNetworkToken(const std::string& token);

    static std::string formatNetworkToken(const MoveText& move);

    /**
     * @brief Whether a received token means the peer ended the game
     *
     * An empty token counts as ended, as a closed connection reads empty.
     */
    static bool isEndToken(const std::string& token);

    static std::string trim(const std::string& text);
};

} // namespace notation
} // namespace chesscore

#endif // CHESSCORE_MOVE_CODEC_H
