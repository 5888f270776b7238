// include/chesscore/notation/fen.h
#ifndef CHESSCORE_FEN_H
#define CHESSCORE_FEN_H

#include <string>
#include "chesscore/game/game_board.h"

namespace chesscore {
namespace notation {

/**
 * @brief Position decoded from FEN text
 */
struct FenPosition {
    core::Board board;
    core::PieceColor turn = core::PieceColor::WHITE;
    game::StartRights rights;  // All castling rights when the field is absent
    int halfmove_clock = 0;
    int fullmove_number = 1;
};

/**
 * @brief Forsyth-Edwards Notation
 */
class FenCodec {
public:
    static const std::string INITIAL_FEN;

    /**
     * @brief Serialize a session to the six FEN fields
     *
     * Castling rights come from the start rights and the move history (king
     * and rook present and never moved). The en passant field names the
     * square behind a pawn that just advanced two rows, including one given
     * as a start right. The halfmove clock is the session's
     * non-pawn-or-capture counter.
     *
     * @param gameBoard Session
     * @param turn Side to move
     * @param startFullmove Move number of the first history entry
     * @return FEN text
     */
    static std::string toFen(const game::GameBoard& gameBoard, core::PieceColor turn, int startFullmove = 1);

    /**
     * @brief Piece placement field only
     */
    static std::string placement(const core::Board& board);

    /**
     * @brief Parse FEN text
     *
     * Placement and side to move are required; the remaining fields are
     * optional. The en passant square must lie on the third or sixth rank.
     *
     * @throws core::FenParseException on malformed text
     */
    static FenPosition parse(const std::string& fen);

    /**
     * @brief Parse only the placement field
     *
     * @throws core::FenParseException on malformed text
     */
    static core::Board parseBoard(const std::string& placementField);

    /**
     * @brief Session starting from a FEN position, carrying its start rights
     */
    static game::GameBoard toGameBoard(const FenPosition& position);
};

} // namespace notation
} // namespace chesscore

#endif // CHESSCORE_FEN_H
