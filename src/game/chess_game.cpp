// src/game/chess_game.cpp
#include "chesscore/game/chess_game.h"
#include "chesscore/game/move_executor.h"
#include "chesscore/notation/move_codec.h"
#include "chesscore/rules/chess_rules.h"
#include <algorithm>
#include <cstddef>
#include <spdlog/spdlog.h>

namespace chesscore {
namespace game {

using core::Coord;
using core::PieceColor;
using core::PieceType;
using rules::ChessRules;

const std::array<PieceType, 4> ChessGame::PROMOTION_CANDIDATES = {
    PieceType::QUEEN, PieceType::ROOK, PieceType::BISHOP, PieceType::KNIGHT
};

namespace {

bool isPromotionCandidate(PieceType type) {
    const auto& candidates = ChessGame::PROMOTION_CANDIDATES;
    return std::find(candidates.begin(), candidates.end(), type) != candidates.end();
}

} // anonymous namespace

ChessGame::ChessGame() = default;

ChessGame::ChessGame(const GameBoard& gameBoard, PieceColor turn)
    : game_board_(gameBoard), turn_(turn) {

    // Side that made the first recorded move
    size_t moves = game_board_.moveHistory().size();
    starting_turn_ = moves % 2 == 0 ? turn : core::oppositeColor(turn);

    game_board_.goLive();
    if (game_board_.isLatestMovePromotion()) {
        state_ = GameState::PROMOTION;
    } else {
        state_ = GameOracle::evaluate(game_board_, turn_);
    }
}

void ChessGame::reset() {
    game_board_.reset();
    turn_ = PieceColor::WHITE;
    starting_turn_ = PieceColor::WHITE;
    state_ = GameState::PLAYING;
    flipped_ = perspectiveFlippedAtStart();

    if (clock_) {
        clock_ = std::make_unique<Clock>(clock_seconds_);
        clock_->start(turn_);
    }
    spdlog::debug("ChessGame: Reset");
}

void ChessGame::configureLocal() {
    mode_ = GameMode::LOCAL;
    flipped_ = perspectiveFlippedAtStart();
}

void ChessGame::configureBot(bool botMovesFirst) {
    mode_ = GameMode::BOT;
    bot_moves_first_ = botMovesFirst;
    flipped_ = perspectiveFlippedAtStart();
}

void ChessGame::configureRemote(PieceColor localColor) {
    mode_ = GameMode::REMOTE;
    local_color_ = localColor;
    flipped_ = perspectiveFlippedAtStart();
}

bool ChessGame::perspectiveFlippedAtStart() const {
    switch (mode_) {
        case GameMode::LOCAL:  return false;
        case GameMode::BOT:    return bot_moves_first_;
        case GameMode::REMOTE: return local_color_ == PieceColor::BLACK;
    }
    return false;
}

std::optional<PieceColor> ChessGame::opponentColor() const {
    switch (mode_) {
        case GameMode::LOCAL:
            return std::nullopt;
        case GameMode::BOT:
            return bot_moves_first_ ? starting_turn_ : core::oppositeColor(starting_turn_);
        case GameMode::REMOTE:
            return core::oppositeColor(local_color_);
    }
    return std::nullopt;
}

std::optional<PieceColor> ChessGame::winner() const {
    if (state_ != GameState::CHECKMATE) {
        return std::nullopt;
    }
    return core::oppositeColor(turn_);
}

PieceColor ChessGame::turnAt(size_t index) const {
    return index % 2 == 0 ? starting_turn_ : core::oppositeColor(starting_turn_);
}

std::vector<Coord> ChessGame::legalDestinations(const Coord& from) const {
    if (game_board_.isViewingHistory()) {
        // Preview on the viewed position
        if (state_ == GameState::PROMOTION) {
            return {};
        }
        size_t index = game_board_.viewingIndex();
        const core::Board& board = game_board_.viewedBoard();
        if (board.pieceColorAt(from) != turnAt(index)) {
            return {};
        }
        return ChessRules::legalMoves(board, game_board_.rulesHistory(index), from);
    }

    if (state_ != GameState::PLAYING) {
        return {};
    }
    if (game_board_.board().pieceColorAt(from) != turn_) {
        return {};
    }
    return ChessRules::legalMoves(game_board_.board(), game_board_.rulesHistory(), from);
}

std::optional<core::PieceMove> ChessGame::playMove(const Coord& from, const Coord& to) {
    if (!from.isValid() || !to.isValid()) {
        return std::nullopt;
    }

    const core::Board& board = game_board_.viewedBoard();
    Coord target = ChessRules::normalizeDestination(board, from, to);

    auto destinations = legalDestinations(from);
    if (std::find(destinations.begin(), destinations.end(), target) == destinations.end()) {
        spdlog::debug("ChessGame: Rejected {} -> {}", from.toAlgebraic(), to.toAlgebraic());
        return std::nullopt;
    }

    if (game_board_.isViewingHistory()) {
        resumeFromViewedPosition();
    }

    auto move = MoveExecutor::execute(game_board_, from, target);
    if (!move) {
        return std::nullopt;
    }

    if (game_board_.isLatestMovePromotion()) {
        state_ = GameState::PROMOTION;
        spdlog::debug("ChessGame: {} pawn on {} awaiting promotion",
                      core::colorName(turn_), move->to.toAlgebraic());
        return move;
    }

    completeTurn(false);
    return move;
}

std::optional<core::PieceMove> ChessGame::playMove(const Coord& from, const Coord& to,
                                                   std::optional<PieceType> promotion) {
    if (promotion && !isPromotionCandidate(*promotion)) {
        return std::nullopt;
    }

    auto move = playMove(from, to);
    if (move && state_ == GameState::PROMOTION && promotion && promote(*promotion)) {
        move = game_board_.lastMove();
    }
    return move;
}

bool ChessGame::promote(PieceType type) {
    if (state_ != GameState::PROMOTION || !isPromotionCandidate(type)) {
        return false;
    }
    if (!MoveExecutor::promote(game_board_, type)) {
        return false;
    }

    completeTurn(true);
    return true;
}

bool ChessGame::promoteAtCursor(size_t index) {
    if (index >= PROMOTION_CANDIDATES.size()) {
        return false;
    }
    return promote(PROMOTION_CANDIDATES[index]);
}

void ChessGame::completeTurn(bool afterPromotion) {
    turn_ = core::oppositeColor(turn_);
    state_ = GameOracle::evaluate(game_board_, turn_);

    // Local players swap seats; a promotion that ends the game keeps the view
    if (mode_ == GameMode::LOCAL && !(afterPromotion && isTerminal())) {
        flipped_ = !flipped_;
    }

    if (clock_) {
        if (isTerminal()) {
            clock_->stop();
        } else {
            clock_->start(turn_);
        }
    }

    if (isTerminal()) {
        spdlog::info("ChessGame: Game over ({}) after {} moves", gameStateName(state_),
                     game_board_.moveHistory().size());
    }
}

void ChessGame::resumeFromViewedPosition() {
    size_t index = game_board_.viewingIndex();
    game_board_.truncateAt(index);

    turn_ = turnAt(index);
    state_ = GameState::PLAYING;
    if (mode_ == GameMode::LOCAL) {
        flipped_ = turn_ != starting_turn_;
    }
    spdlog::info("ChessGame: Resuming from position {}", index);
}

bool ChessGame::applyMoveText(const Coord& from, const Coord& to, std::optional<PieceType> promotion) {
    auto move = playMove(from, to, promotion);
    if (!move) {
        return false;
    }

    // Promotion without a letter defaults to a queen
    if (state_ == GameState::PROMOTION) {
        return promote(PieceType::QUEEN);
    }
    return true;
}

bool ChessGame::applyEngineMove(const std::string& text) {
    auto move = notation::MoveCodec::parseEngineMove(text);
    if (!move) {
        spdlog::warn("ChessGame: Malformed engine move '{}'", text);
        return false;
    }
    return applyMoveText(move->from, move->to, move->promotion);
}

bool ChessGame::applyNetworkMove(const std::string& token) {
    auto move = notation::MoveCodec::parseNetworkToken(token);
    if (!move) {
        spdlog::warn("ChessGame: Malformed network token '{}'", token);
        return false;
    }
    return applyMoveText(move->from, move->to, move->promotion);
}

bool ChessGame::navigatePrevious() {
    return game_board_.navigatePrevious();
}

bool ChessGame::navigateNext() {
    return game_board_.navigateNext();
}

void ChessGame::goLive() {
    game_board_.goLive();
}

void ChessGame::attachClock(int seconds) {
    clock_seconds_ = seconds;
    clock_ = std::make_unique<Clock>(seconds);
    if (!isTerminal()) {
        clock_->start(turn_);
    }
}

bool ChessGame::isTimeUp() const {
    return clock_ && clock_->isTimeUp(turn_);
}

} // namespace game
} // namespace chesscore
