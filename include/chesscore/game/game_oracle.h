// include/chesscore/game/game_oracle.h
#ifndef CHESSCORE_GAME_ORACLE_H
#define CHESSCORE_GAME_ORACLE_H

#include <string>
#include "chesscore/game/game_board.h"

namespace chesscore {
namespace game {

/**
 * @brief Finite state of a game
 */
enum class GameState {
    PLAYING,
    PROMOTION,
    CHECKMATE,
    DRAW
};

std::string gameStateName(GameState state);

/**
 * @brief Terminal condition queries on a game session
 */
class GameOracle {
public:
    /**
     * @brief Half-moves without a pawn move or capture that draw the game
     *
     * Counted in half-moves, so this is stricter than the usual 100.
     */
    static constexpr int FIFTY_MOVE_THRESHOLD = 50;

    /**
     * @brief Occurrences of one layout that draw the game
     */
    static constexpr int REPETITION_THRESHOLD = 3;

    /**
     * @brief Sum of the legal move counts of every piece of a color
     */
    static int legalMoveCount(const GameBoard& gameBoard, core::PieceColor color);

    static bool isInCheck(const GameBoard& gameBoard, core::PieceColor color);

    /**
     * @brief In check with no legal move
     */
    static bool isCheckmate(const GameBoard& gameBoard, core::PieceColor color);

    /**
     * @brief Not in check and no legal move
     */
    static bool isStalemate(const GameBoard& gameBoard, core::PieceColor color);

    static bool isFiftyMoveDraw(const GameBoard& gameBoard);

    /**
     * @brief Some layout appears three times in the position history
     *
     * Layouts compare piece placement only; side to move and castling or
     * en passant rights are ignored.
     */
    static bool isDrawByRepetition(const GameBoard& gameBoard);

    /**
     * @brief Stalemate, fifty-move rule or repetition
     */
    static bool isDraw(const GameBoard& gameBoard, core::PieceColor color);

    /**
     * @brief State of the game with @p color to move
     *
     * @return CHECKMATE, DRAW or PLAYING
     */
    static GameState evaluate(const GameBoard& gameBoard, core::PieceColor color);

    /**
     * @brief Check for insufficient material
     *
     * Informational only; it does not end the game.
     *
     * @return true if neither side can possibly mate
     */
    static bool hasInsufficientMaterial(const GameBoard& gameBoard);
};

} // namespace game
} // namespace chesscore

#endif // CHESSCORE_GAME_ORACLE_H
