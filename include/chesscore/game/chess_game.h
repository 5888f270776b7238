// include/chesscore/game/chess_game.h
#ifndef CHESSCORE_CHESS_GAME_H
#define CHESSCORE_CHESS_GAME_H

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "chesscore/game/clock.h"
#include "chesscore/game/game_board.h"
#include "chesscore/game/game_oracle.h"

namespace chesscore {
namespace game {

/**
 * @brief Who sits on the other side of the board
 */
enum class GameMode {
    LOCAL,   // Two players sharing one board
    BOT,     // Against an external engine
    REMOTE   // Against a network peer
};

/**
 * @brief Per-game state machine
 *
 * Owns the session, the side to move and the game state. Moves go through
 * select (legalDestinations), play (playMove), then promotion resolution if
 * needed. CHECKMATE and DRAW are terminal until reset().
 *
 * The flip flag tells renderers to draw the board rotated. The rules always
 * work on the stored orientation.
 */
class ChessGame {
public:
    /**
     * @brief Promotion choices in cursor order
     */
    static const std::array<core::PieceType, 4> PROMOTION_CANDIDATES;

    /**
     * @brief New game from the standard layout, White to move
     */
    ChessGame();

    /**
     * @brief Game continuing from an existing session
     *
     * @param gameBoard Session, e.g. the result of a PGN replay
     * @param turn Side to move
     */
    ChessGame(const GameBoard& gameBoard, core::PieceColor turn);

    /**
     * @brief Back to the standard layout, White to move, mode kept
     */
    void reset();

    // Mode and perspective

    void configureLocal();

    /**
     * @brief Play against an engine
     *
     * @param botMovesFirst The engine has the first move; the board is then
     *        shown flipped for the whole game
     */
    void configureBot(bool botMovesFirst);

    /**
     * @brief Play against a network peer
     *
     * @param localColor Color of the local player; Black sees the board flipped
     */
    void configureRemote(core::PieceColor localColor);

    GameMode mode() const { return mode_; }
    bool isFlipped() const { return flipped_; }

    /**
     * @brief Color the engine or peer plays, empty in LOCAL mode
     */
    std::optional<core::PieceColor> opponentColor() const;

    // State

    const GameBoard& gameBoard() const { return game_board_; }
    core::PieceColor turn() const { return turn_; }
    core::PieceColor startingTurn() const { return starting_turn_; }
    GameState state() const { return state_; }
    bool isTerminal() const { return state_ == GameState::CHECKMATE || state_ == GameState::DRAW; }

    /**
     * @brief Winner of a checkmated game
     */
    std::optional<core::PieceColor> winner() const;

    // Moves

    /**
     * @brief Legal destinations for the piece on a square
     *
     * Empty unless the game is PLAYING and the square holds a piece of the
     * side to move. While viewing history, answers for the viewed position.
     */
    std::vector<core::Coord> legalDestinations(const core::Coord& from) const;

    /**
     * @brief Play a move if it is legal
     *
     * Enters PROMOTION when a pawn reaches its last row; otherwise the turn
     * passes and the oracle decides the new state.
     *
     * @return The recorded move, or empty if rejected
     */
    std::optional<core::PieceMove> playMove(const core::Coord& from, const core::Coord& to);

    /**
     * @brief Play a move and resolve its promotion in one step
     *
     * @param promotion Kind to promote to; ignored when the move does not
     *        promote, and PROMOTION is left pending when absent
     * @return The recorded move, or empty if rejected
     */
    std::optional<core::PieceMove> playMove(const core::Coord& from, const core::Coord& to,
                                            std::optional<core::PieceType> promotion);

    /**
     * @brief Resolve a pending promotion
     *
     * @return false if no promotion is pending or @p type is not a candidate
     */
    bool promote(core::PieceType type);

    /**
     * @brief Resolve a pending promotion from a cursor position
     *
     * @param index Index into PROMOTION_CANDIDATES
     */
    bool promoteAtCursor(size_t index);

    /**
     * @brief Play a long-algebraic engine move ("e2e4", "e7e8q")
     *
     * @return false if the text is malformed or the move is illegal
     */
    bool applyEngineMove(const std::string& text);

    /**
     * @brief Play a network move token ("6444", "1404q")
     *
     * @return false if the token is malformed or the move is illegal
     */
    bool applyNetworkMove(const std::string& token);

    // History navigation

    bool navigatePrevious();
    bool navigateNext();
    void goLive();
    bool isViewingHistory() const { return game_board_.isViewingHistory(); }

    /**
     * @brief Side to move at a position history index
     */
    core::PieceColor turnAt(size_t index) const;

    // Clock

    /**
     * @brief Give the game a clock; it starts with the side to move
     */
    void attachClock(int seconds);

    Clock* clock() { return clock_.get(); }
    const Clock* clock() const { return clock_.get(); }

    /**
     * @brief Whether the side to move has run out of time
     */
    bool isTimeUp() const;

private:
    GameBoard game_board_;
    core::PieceColor turn_ = core::PieceColor::WHITE;
    core::PieceColor starting_turn_ = core::PieceColor::WHITE;
    GameState state_ = GameState::PLAYING;
    GameMode mode_ = GameMode::LOCAL;
    bool flipped_ = false;
    bool bot_moves_first_ = false;
    core::PieceColor local_color_ = core::PieceColor::WHITE;
    std::unique_ptr<Clock> clock_;
    int clock_seconds_ = 0;

    void completeTurn(bool afterPromotion);
    void resumeFromViewedPosition();
    bool applyMoveText(const core::Coord& from, const core::Coord& to,
                       std::optional<core::PieceType> promotion);
    bool perspectiveFlippedAtStart() const;
};

} // namespace game
} // namespace chesscore

#endif // CHESSCORE_CHESS_GAME_H
