// src/game/move_executor.cpp
#include "chesscore/game/move_executor.h"
#include "chesscore/rules/board_update.h"
#include <spdlog/spdlog.h>

namespace chesscore {
namespace game {

using core::Coord;
using core::Piece;
using core::PieceType;
using rules::BoardUpdate;

std::optional<core::PieceMove> MoveExecutor::execute(
    GameBoard& gameBoard,
    const Coord& from,
    const Coord& to) {

    if (!from.isValid() || !to.isValid()) {
        return std::nullopt;
    }

    if (!gameBoard.viewedBoard().at(from)) {
        return std::nullopt;
    }

    if (gameBoard.isViewingHistory()) {
        spdlog::debug("MoveExecutor: Truncating history at index {}", gameBoard.viewingIndex());
        gameBoard.truncateAt(gameBoard.viewingIndex());
    }

    core::Board& board = gameBoard.board_;
    auto piece = board.at(from);

    auto target = board.at(to);
    bool enemyAtTarget = target && target->color != piece->color;
    auto castling = BoardUpdate::castlingSquares(board, from, to);

    // 1. Fifty-move counter
    if (piece->type == PieceType::PAWN || enemyAtTarget) {
        gameBoard.consecutive_non_pawn_or_capture_ = 0;
    } else {
        gameBoard.consecutive_non_pawn_or_capture_++;
    }

    // 2. Regular capture
    if (enemyAtTarget && !castling) {
        gameBoard.addTaken(piece->color, *target);
    }

    // 3. En passant capture
    if (!castling && BoardUpdate::isEnPassantShape(board, from, to)) {
        auto victim = board.at(BoardUpdate::enPassantVictim(from, to));
        if (victim && victim->color != piece->color) {
            gameBoard.addTaken(piece->color, *victim);
        }
    }

    // 4. and 5. Castling relocation or plain move
    BoardUpdate::apply(board, from, to);

    // 6. Histories
    core::PieceMove move(piece->type, piece->color, from, castling ? castling->king_to : to);
    gameBoard.record(move);

    spdlog::debug("MoveExecutor: {} {} {} -> {}", core::colorName(piece->color),
                  core::pieceTypeName(piece->type), from.toAlgebraic(), move.to.toAlgebraic());

    return move;
}

bool MoveExecutor::promote(GameBoard& gameBoard, PieceType type) {
    if (type == PieceType::PAWN || type == PieceType::KING) {
        return false;
    }
    if (!gameBoard.isLatestMovePromotion()) {
        return false;
    }

    core::PieceMove& last = gameBoard.move_history_.back();
    gameBoard.board_.set(last.to, Piece(type, last.piece_color));
    last.promotion = type;
    gameBoard.position_history_.back() = gameBoard.board_;

    spdlog::debug("MoveExecutor: Promoted on {} to {}", last.to.toAlgebraic(), core::pieceTypeName(type));
    return true;
}

void MoveExecutor::applyToBoard(core::Board& board, const Coord& from, const Coord& to) {
    BoardUpdate::apply(board, from, to);
}

} // namespace game
} // namespace chesscore
