#include <gtest/gtest.h>
#include "chesscore/core/exceptions.h"
#include "chesscore/game/move_executor.h"
#include "chesscore/notation/san.h"

namespace chesscore {
namespace notation {

using core::Board;
using core::Coord;
using core::PgnParseException;
using core::Piece;
using core::PieceColor;
using core::PieceType;

namespace {

Coord sq(const std::string& name) {
    return *Coord::fromAlgebraic(name);
}

} // anonymous namespace

class SanTest : public ::testing::Test {
protected:
    void SetUp() override {
        rooks.set(sq("e2"), Piece(PieceType::KING, PieceColor::WHITE));
        rooks.set(sq("a1"), Piece(PieceType::ROOK, PieceColor::WHITE));
        rooks.set(sq("h1"), Piece(PieceType::ROOK, PieceColor::WHITE));
        rooks.set(sq("a5"), Piece(PieceType::ROOK, PieceColor::WHITE));
        rooks.set(sq("h8"), Piece(PieceType::KING, PieceColor::BLACK));
    }

    void play(game::GameBoard& target, const std::string& from, const std::string& to) {
        ASSERT_TRUE(game::MoveExecutor::execute(target, sq(from), sq(to)).has_value());
    }

    game::GameBoard gameBoard;
    Board rooks;
};

TEST_F(SanTest, SimpleMoves) {
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("e2"), sq("e4")), "e4");
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("g1"), sq("f3")), "Nf3");
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("e4"), sq("e5")), "");
}

TEST_F(SanTest, Captures) {
    play(gameBoard, "e2", "e4");
    play(gameBoard, "d7", "d5");
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("e4"), sq("d5")), "exd5");

    play(gameBoard, "e4", "e5");
    play(gameBoard, "f7", "f5");
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("e5"), sq("f6")), "exf6");

    play(gameBoard, "d1", "g4");
    play(gameBoard, "a7", "a6");
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("g4"), sq("g7")), "Qxg7");
}

TEST_F(SanTest, Disambiguation) {
    game::GameBoard session(rooks);
    EXPECT_EQ(SanCodec::toSan(session, sq("a1"), sq("d1")), "Rad1");
    EXPECT_EQ(SanCodec::toSan(session, sq("h1"), sq("d1")), "Rhd1");
    EXPECT_EQ(SanCodec::toSan(session, sq("a1"), sq("a3")), "R1a3");
    EXPECT_EQ(SanCodec::toSan(session, sq("a5"), sq("a3")), "R5a3");
    EXPECT_EQ(SanCodec::toSan(session, sq("h1"), sq("h7")), "Rh7+");
}

TEST_F(SanTest, CastlingAndMate) {
    play(gameBoard, "e2", "e4");
    play(gameBoard, "e7", "e5");
    play(gameBoard, "g1", "f3");
    play(gameBoard, "b8", "c6");
    play(gameBoard, "f1", "c4");
    play(gameBoard, "g8", "f6");
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("e1"), sq("g1")), "O-O");
    EXPECT_EQ(SanCodec::toSan(gameBoard, sq("e1"), sq("h1")), "O-O");

    game::GameBoard fools;
    play(fools, "f2", "f3");
    play(fools, "e7", "e5");
    play(fools, "g2", "g4");
    EXPECT_EQ(SanCodec::toSan(fools, sq("d8"), sq("h4")), "Qh4#");
}

TEST_F(SanTest, Promotion) {
    Board board;
    board.set(sq("e1"), Piece(PieceType::KING, PieceColor::WHITE));
    board.set(sq("b7"), Piece(PieceType::PAWN, PieceColor::WHITE));
    board.set(sq("h8"), Piece(PieceType::KING, PieceColor::BLACK));
    board.set(sq("a8"), Piece(PieceType::BISHOP, PieceColor::BLACK));
    game::GameBoard session(board);

    EXPECT_EQ(SanCodec::toSan(session, sq("b7"), sq("b8"), PieceType::QUEEN), "b8=Q+");
    EXPECT_EQ(SanCodec::toSan(session, sq("b7"), sq("b8"), PieceType::KNIGHT), "b8=N");
    EXPECT_EQ(SanCodec::toSan(session, sq("b7"), sq("a8"), PieceType::ROOK), "bxa8=R+");
}

TEST_F(SanTest, StripAnnotations) {
    EXPECT_EQ(SanCodec::stripAnnotations("Nf3+"), "Nf3");
    EXPECT_EQ(SanCodec::stripAnnotations("Qh4#"), "Qh4");
    EXPECT_EQ(SanCodec::stripAnnotations("e4!?"), "e4");
    EXPECT_EQ(SanCodec::stripAnnotations("O-O"), "O-O");
}

TEST_F(SanTest, ResolveMoves) {
    MoveText pawn = SanCodec::resolve(gameBoard, "e4", PieceColor::WHITE);
    EXPECT_EQ(pawn.from, sq("e2"));
    EXPECT_EQ(pawn.to, sq("e4"));
    EXPECT_FALSE(pawn.promotion.has_value());

    MoveText knight = SanCodec::resolve(gameBoard, "Nf3+", PieceColor::WHITE);
    EXPECT_EQ(knight.from, sq("g1"));

    MoveText black = SanCodec::resolve(gameBoard, "Nc6", PieceColor::BLACK);
    EXPECT_EQ(black.from, sq("b8"));
}

TEST_F(SanTest, ResolveWithHints) {
    game::GameBoard session(rooks);
    EXPECT_EQ(SanCodec::resolve(session, "Rad1", PieceColor::WHITE).from, sq("a1"));
    EXPECT_EQ(SanCodec::resolve(session, "Rhd1", PieceColor::WHITE).from, sq("h1"));
    EXPECT_EQ(SanCodec::resolve(session, "R5a3", PieceColor::WHITE).from, sq("a5"));
    EXPECT_EQ(SanCodec::resolve(session, "Ra1a3", PieceColor::WHITE).from, sq("a1"));
}

TEST_F(SanTest, ResolveCastling) {
    Board board;
    board.set(sq("e8"), Piece(PieceType::KING, PieceColor::BLACK));
    board.set(sq("a8"), Piece(PieceType::ROOK, PieceColor::BLACK));
    board.set(sq("h8"), Piece(PieceType::ROOK, PieceColor::BLACK));
    board.set(sq("e1"), Piece(PieceType::KING, PieceColor::WHITE));
    game::GameBoard session(board);

    MoveText kingside = SanCodec::resolve(session, "O-O", PieceColor::BLACK);
    EXPECT_EQ(kingside.from, sq("e8"));
    EXPECT_EQ(kingside.to, sq("g8"));

    MoveText queenside = SanCodec::resolve(session, "0-0-0", PieceColor::BLACK);
    EXPECT_EQ(queenside.to, sq("c8"));

    EXPECT_THROW(SanCodec::resolve(session, "O-O", PieceColor::WHITE), PgnParseException);
}

TEST_F(SanTest, ResolvePromotion) {
    Board board;
    board.set(sq("e1"), Piece(PieceType::KING, PieceColor::WHITE));
    board.set(sq("b7"), Piece(PieceType::PAWN, PieceColor::WHITE));
    board.set(sq("h6"), Piece(PieceType::KING, PieceColor::BLACK));
    game::GameBoard session(board);

    EXPECT_EQ(SanCodec::resolve(session, "b8=N", PieceColor::WHITE).promotion, PieceType::KNIGHT);
    EXPECT_EQ(SanCodec::resolve(session, "b8Q", PieceColor::WHITE).promotion, PieceType::QUEEN);
    EXPECT_THROW(SanCodec::resolve(session, "b8", PieceColor::WHITE), PgnParseException);
    EXPECT_THROW(SanCodec::resolve(session, "b8=K", PieceColor::WHITE), PgnParseException);
    EXPECT_THROW(SanCodec::resolve(session, "Ke2=Q", PieceColor::WHITE), PgnParseException);
}

TEST_F(SanTest, ResolveErrors) {
    try {
        SanCodec::resolve(gameBoard, "Ke2", PieceColor::WHITE);
        FAIL() << "Expected PgnParseException";
    } catch (const PgnParseException& e) {
        EXPECT_EQ(e.getToken(), "Ke2");
    }

    game::GameBoard session(rooks);
    EXPECT_THROW(SanCodec::resolve(session, "Rd1", PieceColor::WHITE), PgnParseException);
    EXPECT_THROW(SanCodec::resolve(session, "Ra3", PieceColor::WHITE), PgnParseException);
    EXPECT_THROW(SanCodec::resolve(gameBoard, "", PieceColor::WHITE), PgnParseException);
    EXPECT_THROW(SanCodec::resolve(gameBoard, "Nz9", PieceColor::WHITE), PgnParseException);
    EXPECT_THROW(SanCodec::resolve(gameBoard, "e5", PieceColor::WHITE), PgnParseException);
}

} // namespace notation
} // namespace chesscore
