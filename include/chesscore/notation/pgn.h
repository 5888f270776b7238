// include/chesscore/notation/pgn.h
#ifndef CHESSCORE_PGN_H
#define CHESSCORE_PGN_H

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "chesscore/game/game_board.h"

namespace chesscore {
namespace notation {

/**
 * @brief Outcome of replaying PGN text
 */
struct PgnGame {
    std::map<std::string, std::string> headers;
    std::vector<std::string> tokens;     // Move tokens, in order
    std::optional<std::string> result;   // "1-0", "0-1", "1/2-1/2" or "*"
    game::GameBoard game_board;
    core::PieceColor turn = core::PieceColor::WHITE;
    int start_fullmove = 1;
};

/**
 * @brief Plain move-list PGN reader
 *
 * Supports [Tag "value"] headers, move numbers, result markers, {...} and
 * ';' comments, (...) variations and $n glyphs. A [FEN] header sets the
 * starting position.
 */
class PgnLoader {
public:
    /**
     * @brief Split PGN text into move tokens
     *
     * @param text PGN text
     * @param headers Receives the header tags, may be null
     * @param result Receives the result marker, may be null
     * @return Move tokens with move numbers and markers removed
     */
    static std::vector<std::string> tokenize(
        const std::string& text,
        std::map<std::string, std::string>* headers = nullptr,
        std::optional<std::string>* result = nullptr);

    /**
     * @brief Replay PGN text
     *
     * @throws core::PgnParseException on the first token that is not a legal move
     * @throws core::FenParseException on a malformed [FEN] header
     */
    static PgnGame parse(const std::string& text);

    /**
     * @brief Read a file and replay it
     *
     * @throws core::ChessException if the file cannot be read
     */
    static PgnGame loadFile(const std::string& path);

    static bool isResultMarker(const std::string& token);
};

/**
 * @brief PGN export of a session
 */
class PgnWriter {
public:
    /**
     * @brief Write headers and SAN move text
     *
     * The seven standard tags are always present, filled with "?" when
     * missing; "Result" comes from @p result.
     *
     * @param gameBoard Session to export; replayed from its first position
     * @param startTurn Side that made the first move
     * @param headers Tags to write
     * @param result Result marker
     * @return PGN text
     */
    static std::string write(
        const game::GameBoard& gameBoard,
        core::PieceColor startTurn,
        const std::map<std::string, std::string>& headers = {},
        const std::string& result = "*");

    /**
     * @brief SAN move text only, e.g. "1. e4 e5 2. Nf3"
     */
    static std::string moveText(const game::GameBoard& gameBoard, core::PieceColor startTurn);

    static bool saveFile(const std::string& path, const std::string& pgn);
};

} // namespace notation
} // namespace chesscore

#endif // CHESSCORE_PGN_H
