// src/game/game_board.cpp
#include "chesscore/game/game_board.h"
#include "chesscore/rules/board_update.h"
#include "chesscore/rules/chess_rules.h"
#include <algorithm>

namespace chesscore {
namespace game {

using core::Board;
using core::Piece;
using core::PieceColor;
using core::PieceType;

GameBoard::GameBoard() {
    start(Board::initial(), 0);
}

GameBoard::GameBoard(const Board& board, int consecutiveNonPawnOrCapture) {
    start(board, consecutiveNonPawnOrCapture);
}

void GameBoard::reset() {
    start(Board::initial(), 0);
}

void GameBoard::start(const Board& board, int consecutiveNonPawnOrCapture) {
    board_ = board;
    move_history_.clear();
    white_taken_.clear();
    black_taken_.clear();
    consecutive_non_pawn_or_capture_ = consecutiveNonPawnOrCapture;
    viewing_index_.reset();
    start_rights_ = StartRights();
    setup_moves_.clear();

    position_history_.assign(1, board_);
    snapshots_.assign(1, snapshot());
}

void GameBoard::setConsecutiveNonPawnOrCapture(int value) {
    consecutive_non_pawn_or_capture_ = value;
    snapshots_.back().consecutive_non_pawn_or_capture = value;
}

void GameBoard::setStartRights(const StartRights& rights) {
    start_rights_ = rights;
    setup_moves_.clear();

    auto dropRight = [this](PieceColor color, bool kingside) {
        rules::CastlingHome home = rules::ChessRules::castlingHome(color);
        core::Coord rook = kingside ? home.kingside_rook : home.queenside_rook;
        setup_moves_.emplace_back(PieceType::ROOK, color, rook, rook);
    };
    if (!rights.white_kingside) dropRight(PieceColor::WHITE, true);
    if (!rights.white_queenside) dropRight(PieceColor::WHITE, false);
    if (!rights.black_kingside) dropRight(PieceColor::BLACK, true);
    if (!rights.black_queenside) dropRight(PieceColor::BLACK, false);

    // Only the third and sixth ranks can hold an en passant square
    if (rights.en_passant && (rights.en_passant->row == 5 || rights.en_passant->row == 2)) {
        const core::Coord& target = *rights.en_passant;
        PieceColor pusher = target.row == 5 ? PieceColor::WHITE : PieceColor::BLACK;
        int direction = rules::PieceMovement::pawnDirection(pusher);
        setup_moves_.emplace_back(PieceType::PAWN, pusher,
                                  core::Coord(target.row - direction, target.col),
                                  core::Coord(target.row + direction, target.col));
    }
}

MoveHistory GameBoard::rulesHistory() const {
    return rulesHistory(position_history_.size() - 1);
}

MoveHistory GameBoard::rulesHistory(size_t positionIndex) const {
    size_t count = std::min(positionIndex, move_history_.size());
    MoveHistory history = setup_moves_;
    history.insert(history.end(), move_history_.begin(),
                   move_history_.begin() + static_cast<std::ptrdiff_t>(count));
    return history;
}

const std::vector<Piece>& GameBoard::takenPieces(PieceColor capturer) const {
    return capturer == PieceColor::WHITE ? white_taken_ : black_taken_;
}

int GameBoard::materialBalance(PieceColor color) const {
    auto sum = [](const std::vector<Piece>& pieces) {
        int total = 0;
        for (const auto& piece : pieces) {
            total += core::pieceRank(piece.type);
        }
        return total;
    };
    int own = sum(takenPieces(color));
    int other = sum(takenPieces(core::oppositeColor(color)));
    return own - other;
}

std::optional<core::PieceMove> GameBoard::lastMove() const {
    if (move_history_.empty()) {
        return std::nullopt;
    }
    return move_history_.back();
}

bool GameBoard::isLatestMovePromotion() const {
    if (move_history_.empty()) {
        return false;
    }

    const core::PieceMove& last = move_history_.back();
    if (last.piece_type != PieceType::PAWN || last.promotion) {
        return false;
    }

    int lastRow = last.piece_color == PieceColor::WHITE ? 0 : core::BOARD_SIZE - 1;
    auto piece = board_.at(last.to);
    return last.to.row == lastRow && piece && piece->type == PieceType::PAWN;
}

bool GameBoard::validate() const {
    if (position_history_.size() != move_history_.size() + 1 ||
        snapshots_.size() != position_history_.size()) {
        return false;
    }
    if (position_history_.back() != board_) {
        return false;
    }

    Board replay = position_history_.front();
    for (size_t i = 0; i < move_history_.size(); ++i) {
        const core::PieceMove& move = move_history_[i];
        rules::BoardUpdate::apply(replay, move.from, move.to);
        if (move.promotion) {
            replay.set(move.to, Piece(*move.promotion, move.piece_color));
        }
        if (replay != position_history_[i + 1]) {
            return false;
        }
    }
    return true;
}

bool GameBoard::navigatePrevious() {
    size_t index = viewingIndex();
    if (index == 0) {
        return false;
    }
    viewing_index_ = index - 1;
    return true;
}

bool GameBoard::navigateNext() {
    if (!viewing_index_) {
        return false;
    }

    size_t next = *viewing_index_ + 1;
    if (next >= position_history_.size() - 1) {
        viewing_index_.reset();
    } else {
        viewing_index_ = next;
    }
    return true;
}

void GameBoard::goLive() {
    viewing_index_.reset();
}

size_t GameBoard::viewingIndex() const {
    return viewing_index_ ? *viewing_index_ : position_history_.size() - 1;
}

const Board& GameBoard::viewedBoard() const {
    return position_history_[viewingIndex()];
}

bool GameBoard::truncateAt(size_t index) {
    if (index >= position_history_.size()) {
        return false;
    }

    position_history_.resize(index + 1);
    snapshots_.resize(index + 1);
    move_history_.resize(index);

    board_ = position_history_.back();
    const PositionSnapshot& kept = snapshots_.back();
    consecutive_non_pawn_or_capture_ = kept.consecutive_non_pawn_or_capture;
    white_taken_ = kept.white_taken;
    black_taken_ = kept.black_taken;

    viewing_index_.reset();
    return true;
}

void GameBoard::record(const core::PieceMove& move) {
    move_history_.push_back(move);
    position_history_.push_back(board_);
    snapshots_.push_back(snapshot());
}

PositionSnapshot GameBoard::snapshot() const {
    PositionSnapshot entry;
    entry.consecutive_non_pawn_or_capture = consecutive_non_pawn_or_capture_;
    entry.white_taken = white_taken_;
    entry.black_taken = black_taken_;
    return entry;
}

void GameBoard::addTaken(PieceColor capturer, const Piece& piece) {
    auto& taken = capturer == PieceColor::WHITE ? white_taken_ : black_taken_;
    taken.push_back(piece);
    std::stable_sort(taken.begin(), taken.end(), [](const Piece& a, const Piece& b) {
        return core::pieceRank(a.type) < core::pieceRank(b.type);
    });
}

} // namespace game
} // namespace chesscore
