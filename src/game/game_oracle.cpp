// src/game/game_oracle.cpp
#include "chesscore/game/game_oracle.h"
#include "chesscore/core/zobrist_hash.h"
#include "chesscore/rules/chess_rules.h"
#include "chesscore/rules/check_detector.h"
#include <unordered_map>

namespace chesscore {
namespace game {

using core::Coord;
using core::PieceColor;
using core::PieceType;

std::string gameStateName(GameState state) {
    switch (state) {
        case GameState::PLAYING:   return "Playing";
        case GameState::PROMOTION: return "Promotion";
        case GameState::CHECKMATE: return "Checkmate";
        case GameState::DRAW:      return "Draw";
    }
    return "Unknown";
}

int GameOracle::legalMoveCount(const GameBoard& gameBoard, PieceColor color) {
    return rules::ChessRules::legalMoveCount(gameBoard.board(), gameBoard.rulesHistory(), color);
}

bool GameOracle::isInCheck(const GameBoard& gameBoard, PieceColor color) {
    return rules::CheckDetector::isInCheck(gameBoard.board(), gameBoard.rulesHistory(), color);
}

bool GameOracle::isCheckmate(const GameBoard& gameBoard, PieceColor color) {
    return isInCheck(gameBoard, color) && legalMoveCount(gameBoard, color) == 0;
}

bool GameOracle::isStalemate(const GameBoard& gameBoard, PieceColor color) {
    return !isInCheck(gameBoard, color) && legalMoveCount(gameBoard, color) == 0;
}

bool GameOracle::isFiftyMoveDraw(const GameBoard& gameBoard) {
    return gameBoard.consecutiveNonPawnOrCapture() >= FIFTY_MOVE_THRESHOLD;
}

bool GameOracle::isDrawByRepetition(const GameBoard& gameBoard) {
    std::unordered_map<core::Board, int, core::BoardHasher> occurrences;
    for (const auto& position : gameBoard.positionHistory()) {
        if (++occurrences[position] >= REPETITION_THRESHOLD) {
            return true;
        }
    }
    return false;
}

bool GameOracle::isDraw(const GameBoard& gameBoard, PieceColor color) {
    return isStalemate(gameBoard, color) || isFiftyMoveDraw(gameBoard) || isDrawByRepetition(gameBoard);
}

GameState GameOracle::evaluate(const GameBoard& gameBoard, PieceColor color) {
    bool inCheck = isInCheck(gameBoard, color);
    bool noMoves = legalMoveCount(gameBoard, color) == 0;

    if (inCheck && noMoves) {
        return GameState::CHECKMATE;
    }
    if (noMoves || isFiftyMoveDraw(gameBoard) || isDrawByRepetition(gameBoard)) {
        return GameState::DRAW;
    }
    return GameState::PLAYING;
}

bool GameOracle::hasInsufficientMaterial(const GameBoard& gameBoard) {
    const core::Board& board = gameBoard.board();

    // Count material on the board
    int numWhiteKnights = 0;
    int numBlackKnights = 0;
    int numWhiteBishops = 0;
    int numBlackBishops = 0;
    int numOther = 0;  // Pawns, rooks and queens of either color
    int whiteBishopSquareColor = -1;
    int blackBishopSquareColor = -1;

    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        for (int col = 0; col < core::BOARD_SIZE; ++col) {
            auto piece = board.at(Coord(row, col));
            if (!piece) continue;

            bool white = piece->color == PieceColor::WHITE;
            switch (piece->type) {
                case PieceType::KNIGHT:
                    (white ? numWhiteKnights : numBlackKnights)++;
                    break;
                case PieceType::BISHOP:
                    (white ? numWhiteBishops : numBlackBishops)++;
                    (white ? whiteBishopSquareColor : blackBishopSquareColor) = (row + col) % 2;
                    break;
                case PieceType::KING:
                    break;
                default:
                    numOther++;
                    break;
            }
        }
    }

    if (numOther > 0) {
        return false;
    }

    int minorPieces = numWhiteKnights + numBlackKnights + numWhiteBishops + numBlackBishops;

    // King vs King, King and minor piece vs King
    if (minorPieces <= 1) {
        return true;
    }

    // King and Bishop vs King and Bishop with bishops on the same color
    if (numWhiteKnights == 0 && numBlackKnights == 0 &&
        numWhiteBishops == 1 && numBlackBishops == 1 &&
        whiteBishopSquareColor == blackBishopSquareColor) {
        return true;
    }

    return false;
}

} // namespace game
} // namespace chesscore
