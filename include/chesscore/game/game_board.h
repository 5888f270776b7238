// include/chesscore/game/game_board.h
#ifndef CHESSCORE_GAME_BOARD_H
#define CHESSCORE_GAME_BOARD_H

#include <vector>
#include <optional>
#include <cstddef>
#include "chesscore/core/board.h"
#include "chesscore/rules/movement.h"

namespace chesscore {
namespace game {

using rules::MoveHistory;

/**
 * @brief Bookkeeping stored beside each entry of the position history
 *
 * Lets the session be rewound to any earlier entry.
 */
struct PositionSnapshot {
    int consecutive_non_pawn_or_capture = 0;
    std::vector<core::Piece> white_taken;  // Pieces captured by White
    std::vector<core::Piece> black_taken;  // Pieces captured by Black
};

/**
 * @brief Rights a session carries from before its first recorded move
 *
 * Filled from the castling and en passant fields of FEN text.
 */
struct StartRights {
    bool white_kingside = true;
    bool white_queenside = true;
    bool black_kingside = true;
    bool black_queenside = true;
    std::optional<core::Coord> en_passant;  // Square behind a pawn that just advanced two rows
};

/**
 * @brief Game session data: board, histories and counters
 *
 * The position history always holds one entry more than the move history;
 * its first entry is the starting position. Histories are append-only
 * except through truncateAt(). A viewing index can walk back and forth
 * through the position history without changing it.
 *
 * Mutated by MoveExecutor only.
 */
class GameBoard {
public:
    /**
     * @brief Session starting from the standard layout
     */
    GameBoard();

    /**
     * @brief Session starting from a supplied board
     *
     * @param board Starting position
     * @param consecutiveNonPawnOrCapture Initial fifty-move counter
     */
    explicit GameBoard(const core::Board& board, int consecutiveNonPawnOrCapture = 0);

    /**
     * @brief Back to the standard layout with empty histories
     */
    void reset();

    const core::Board& board() const { return board_; }
    const MoveHistory& moveHistory() const { return move_history_; }
    const std::vector<core::Board>& positionHistory() const { return position_history_; }

    int consecutiveNonPawnOrCapture() const { return consecutive_non_pawn_or_capture_; }

    /**
     * @brief Overwrite the fifty-move counter of the current position
     *
     * Used when a session is rebuilt from FEN text.
     */
    void setConsecutiveNonPawnOrCapture(int value);

    /**
     * @brief Carry castling and en passant rights from before the first move
     *
     * A lost castling right is recorded as a setup move of that rook off its
     * home square, an en passant square as the double push that passed it.
     * Setup moves precede the move history in rulesHistory() only; they
     * survive truncateAt() and are cleared by reset().
     */
    void setStartRights(const StartRights& rights);

    const StartRights& startRights() const { return start_rights_; }

    /**
     * @brief History as the move rules see it
     *
     * Setup moves followed by the moves leading to a position history entry.
     *
     * @param positionIndex Entry of the position history, the latest by default
     */
    MoveHistory rulesHistory() const;
    MoveHistory rulesHistory(size_t positionIndex) const;

    /**
     * @brief Pieces captured by a color, sorted by piece rank
     */
    const std::vector<core::Piece>& takenPieces(core::PieceColor capturer) const;

    /**
     * @brief Material difference from a color's point of view, by piece rank
     */
    int materialBalance(core::PieceColor color) const;

    std::optional<core::PieceMove> lastMove() const;

    /**
     * @brief A pawn stands unpromoted on its last row after the latest move
     */
    bool isLatestMovePromotion() const;

    /**
     * @brief Check the history invariants
     *
     * Sizes match and replaying the move history from the first entry gives
     * every following entry.
     */
    bool validate() const;

    // History navigation

    /**
     * @brief Step the viewer one position back
     *
     * @return false if already at the first position
     */
    bool navigatePrevious();

    /**
     * @brief Step the viewer one position forward
     *
     * @return false if already live
     */
    bool navigateNext();

    /**
     * @brief Return the viewer to the latest position
     */
    void goLive();

    bool isViewingHistory() const { return viewing_index_.has_value(); }

    /**
     * @brief Index into the position history of the displayed position
     */
    size_t viewingIndex() const;

    /**
     * @brief Board currently displayed: the viewed entry, or the live board
     */
    const core::Board& viewedBoard() const;

    /**
     * @brief Drop every history entry after an index
     *
     * Restores the board, counter and captured lists of that entry and
     * returns the viewer to live.
     *
     * @param index Position history index to keep as the latest entry
     * @return false if the index is out of range
     */
    bool truncateAt(size_t index);

private:
    friend class MoveExecutor;

    core::Board board_;
    MoveHistory move_history_;
    std::vector<core::Board> position_history_;
    std::vector<PositionSnapshot> snapshots_;  // Parallel to position_history_
    int consecutive_non_pawn_or_capture_ = 0;
    std::vector<core::Piece> white_taken_;
    std::vector<core::Piece> black_taken_;
    std::optional<size_t> viewing_index_;  // Empty when live
    StartRights start_rights_;
    MoveHistory setup_moves_;

    void start(const core::Board& board, int consecutiveNonPawnOrCapture);
    void record(const core::PieceMove& move);
    PositionSnapshot snapshot() const;
    void addTaken(core::PieceColor capturer, const core::Piece& piece);
};

} // namespace game
} // namespace chesscore

#endif // CHESSCORE_GAME_BOARD_H
