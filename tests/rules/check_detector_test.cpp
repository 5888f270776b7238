#include <gtest/gtest.h>
#include "chesscore/rules/check_detector.h"
#include "chesscore/rules/chess_rules.h"
#include <algorithm>

namespace chesscore {
namespace rules {

using core::Board;
using core::Coord;
using core::Piece;
using core::PieceColor;
using core::PieceMove;
using core::PieceType;

namespace {

Coord sq(const std::string& name) {
    return *Coord::fromAlgebraic(name);
}

bool contains(const std::vector<Coord>& squares, const std::string& name) {
    return std::find(squares.begin(), squares.end(), sq(name)) != squares.end();
}

} // anonymous namespace

class CheckDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        place("e1", PieceType::KING, PieceColor::WHITE);
        place("h8", PieceType::KING, PieceColor::BLACK);
    }

    void place(const std::string& square, PieceType type, PieceColor color) {
        board.set(sq(square), Piece(type, color));
    }

    std::vector<Coord> legal(const std::string& square, const MoveHistory& history = {}) {
        return ChessRules::legalMoves(board, history, sq(square));
    }

    Board board;
};

TEST_F(CheckDetectorTest, RookGivesCheck) {
    place("e8", PieceType::ROOK, PieceColor::BLACK);
    EXPECT_TRUE(CheckDetector::isInCheck(board, {}, PieceColor::WHITE));
    EXPECT_FALSE(CheckDetector::isInCheck(board, {}, PieceColor::BLACK));

    // Blocking piece ends the check
    place("e4", PieceType::KNIGHT, PieceColor::WHITE);
    EXPECT_FALSE(CheckDetector::isInCheck(board, {}, PieceColor::WHITE));
}

TEST_F(CheckDetectorTest, NoKingMeansNoCheck) {
    Board empty;
    empty.set(sq("e8"), Piece(PieceType::ROOK, PieceColor::BLACK));
    EXPECT_FALSE(CheckDetector::isInCheck(empty, {}, PieceColor::WHITE));
}

TEST_F(CheckDetectorTest, AttackedSquaresIncludeDefendedPieces) {
    place("c6", PieceType::KNIGHT, PieceColor::BLACK);
    place("d4", PieceType::PAWN, PieceColor::BLACK);

    auto attacked = CheckDetector::attackedSquares(board, {}, PieceColor::WHITE);
    EXPECT_TRUE(attacked.count(sq("d4")) > 0);  // Knight defends its own pawn
    EXPECT_TRUE(attacked.count(sq("e3")) > 0);  // Pawn attacks diagonally
    EXPECT_TRUE(attacked.count(sq("c3")) > 0);
    EXPECT_FALSE(attacked.count(sq("d3")) > 0); // Pawn push is not an attack
}

TEST_F(CheckDetectorTest, KingCannotStepIntoCheck) {
    place("d8", PieceType::ROOK, PieceColor::BLACK);

    auto king = legal("e1");
    EXPECT_EQ(king.size(), 3u);
    EXPECT_TRUE(contains(king, "e2"));
    EXPECT_TRUE(contains(king, "f1"));
    EXPECT_TRUE(contains(king, "f2"));
    EXPECT_FALSE(contains(king, "d1"));
    EXPECT_FALSE(contains(king, "d2"));
}

TEST_F(CheckDetectorTest, KingCannotTakeDefendedPiece) {
    place("e2", PieceType::QUEEN, PieceColor::BLACK);
    place("e8", PieceType::ROOK, PieceColor::BLACK);

    EXPECT_FALSE(contains(legal("e1"), "e2"));
}

TEST_F(CheckDetectorTest, KingCanTakeUndefendedPiece) {
    place("e2", PieceType::QUEEN, PieceColor::BLACK);

    auto king = legal("e1");
    EXPECT_EQ(king.size(), 1u);
    EXPECT_TRUE(contains(king, "e2"));
}

TEST_F(CheckDetectorTest, PinnedPieceCannotLeaveLine) {
    place("e2", PieceType::BISHOP, PieceColor::WHITE);
    place("e8", PieceType::ROOK, PieceColor::BLACK);
    EXPECT_TRUE(legal("e2").empty());

    // A pinned rook slides along the pin, up to capturing the pinner
    board.set(sq("e2"), Piece(PieceType::ROOK, PieceColor::WHITE));
    auto rook = legal("e2");
    EXPECT_EQ(rook.size(), 6u);
    EXPECT_TRUE(contains(rook, "e8"));
    EXPECT_FALSE(contains(rook, "d2"));
}

TEST_F(CheckDetectorTest, CheckMustBeAnswered) {
    place("e8", PieceType::ROOK, PieceColor::BLACK);
    place("a4", PieceType::ROOK, PieceColor::WHITE);

    // The rook may only block on e4
    auto rook = legal("a4");
    EXPECT_EQ(rook.size(), 1u);
    EXPECT_TRUE(contains(rook, "e4"));
}

TEST_F(CheckDetectorTest, EnPassantCannotExposeKing) {
    board = Board();
    place("a5", PieceType::KING, PieceColor::WHITE);
    place("b5", PieceType::PAWN, PieceColor::WHITE);
    place("c5", PieceType::PAWN, PieceColor::BLACK);
    place("h5", PieceType::ROOK, PieceColor::BLACK);
    place("e8", PieceType::KING, PieceColor::BLACK);

    MoveHistory history = {PieceMove(PieceType::PAWN, PieceColor::BLACK, sq("c7"), sq("c5"))};
    EXPECT_TRUE(CheckDetector::leavesKingInCheck(board, history, sq("b5"), sq("c6")));
    EXPECT_FALSE(contains(legal("b5", history), "c6"));
    EXPECT_TRUE(contains(legal("b5", history), "b6"));
}

TEST_F(CheckDetectorTest, LegalMoveCountFromStart) {
    Board initial = Board::initial();
    EXPECT_EQ(ChessRules::legalMoveCount(initial, {}, PieceColor::WHITE), 20);
    EXPECT_EQ(ChessRules::legalMoveCount(initial, {}, PieceColor::BLACK), 20);
}

} // namespace rules
} // namespace chesscore
