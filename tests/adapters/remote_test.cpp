#include <gtest/gtest.h>
#include "chesscore/adapters/remote.h"
#include "chesscore/core/exceptions.h"
#include <deque>
#include <memory>
#include <vector>

namespace chesscore {
namespace adapters {

using core::ChannelException;
using core::Coord;
using core::Piece;
using core::PieceColor;
using core::PieceType;

namespace {

Coord sq(const std::string& name) {
    return *Coord::fromAlgebraic(name);
}

class FakeChannel : public IMoveChannel {
public:
    void send(const std::string& message) override {
        sent.push_back(message);
    }

    std::string receive() override {
        if (incoming.empty()) {
            return "";
        }
        std::string message = incoming.front();
        incoming.pop_front();
        return message;
    }

    std::vector<std::string> sent;
    std::deque<std::string> incoming;
};

} // anonymous namespace

class RemoteTest : public ::testing::Test {
protected:
    void SetUp() override {
        game.configureRemote(PieceColor::WHITE);
        remote = std::make_unique<RemoteOpponent>(channel, PieceColor::BLACK);
    }

    game::ChessGame game;
    FakeChannel channel;
    std::unique_ptr<RemoteOpponent> remote;
};

TEST_F(RemoteTest, SendsLocalMoves) {
    EXPECT_FALSE(remote->sendLastMove(game));
    EXPECT_TRUE(channel.sent.empty());

    ASSERT_TRUE(game.playMove(sq("e2"), sq("e4")).has_value());
    EXPECT_TRUE(remote->sendLastMove(game));
    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_EQ(channel.sent[0], "6444");

    remote->sendEnd();
    EXPECT_EQ(channel.sent.back(), "ended");
}

TEST_F(RemoteTest, SendsPromotionLetter) {
    core::PieceMove move(PieceType::PAWN, PieceColor::WHITE, sq("a7"), sq("a8"));
    move.promotion = PieceType::ROOK;
    remote->sendMove(move);
    EXPECT_EQ(channel.sent.back(), "1000r");
}

TEST_F(RemoteTest, ReceivesPeerMove) {
    ASSERT_TRUE(game.playMove(sq("e2"), sq("e4")).has_value());
    channel.incoming.push_back("1434\n");

    core::PieceMove move = remote->receiveMove(game);
    EXPECT_EQ(move.from, sq("e7"));
    EXPECT_EQ(move.to, sq("e5"));
    EXPECT_EQ(game.turn(), PieceColor::WHITE);

    // Perspective is fixed for remote games
    EXPECT_FALSE(game.isFlipped());
}

TEST_F(RemoteTest, ReceivesPromotion) {
    core::Board board;
    board.set(sq("e8"), Piece(PieceType::KING, PieceColor::WHITE));
    board.set(sq("h1"), Piece(PieceType::KING, PieceColor::BLACK));
    board.set(sq("b2"), Piece(PieceType::PAWN, PieceColor::BLACK));
    game::ChessGame session(game::GameBoard(board), PieceColor::BLACK);

    channel.incoming.push_back("6171n");
    core::PieceMove move = remote->receiveMove(session);
    EXPECT_EQ(move.promotion, PieceType::KNIGHT);
    EXPECT_EQ(session.gameBoard().board().pieceTypeAt(sq("b1")), PieceType::KNIGHT);
}

TEST_F(RemoteTest, PeerEndsGame) {
    ASSERT_TRUE(game.playMove(sq("e2"), sq("e4")).has_value());
    channel.incoming.push_back("ended");

    try {
        remote->receiveMove(game);
        FAIL() << "Expected ChannelException";
    } catch (const ChannelException& e) {
        EXPECT_TRUE(e.isRemoteEnded());
    }

    // A closed connection reads as an empty message
    try {
        remote->receiveMove(game);
        FAIL() << "Expected ChannelException";
    } catch (const ChannelException& e) {
        EXPECT_TRUE(e.isRemoteEnded());
    }
}

TEST_F(RemoteTest, RejectsBadTokens) {
    ASSERT_TRUE(game.playMove(sq("e2"), sq("e4")).has_value());

    channel.incoming.push_back("1404");   // e7e4 is not legal
    try {
        remote->receiveMove(game);
        FAIL() << "Expected ChannelException";
    } catch (const ChannelException& e) {
        EXPECT_FALSE(e.isRemoteEnded());
    }

    channel.incoming.push_back("garbage");
    EXPECT_THROW(remote->receiveMove(game), ChannelException);
    EXPECT_EQ(game.gameBoard().moveHistory().size(), 1u);
}

TEST_F(RemoteTest, RejectsMoveOutOfTurn) {
    // White to move, but the peer plays Black
    channel.incoming.push_back("6444");
    EXPECT_THROW(remote->receiveMove(game), ChannelException);
    EXPECT_TRUE(game.gameBoard().moveHistory().empty());
}

} // namespace adapters
} // namespace chesscore
