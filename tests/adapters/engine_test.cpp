#include <gtest/gtest.h>
#include "chesscore/adapters/engine.h"
#include "chesscore/core/exceptions.h"
#include "chesscore/notation/fen.h"
#include <deque>
#include <vector>

namespace chesscore {
namespace adapters {

using core::Coord;
using core::EngineException;
using core::PieceColor;
using core::PieceType;

namespace {

Coord sq(const std::string& name) {
    return *Coord::fromAlgebraic(name);
}

// Replays canned engine answers and remembers the positions asked about
class FakeEngine : public IMoveEngine {
public:
    std::string bestMove(const std::string& fen, const EngineSettings& settings) override {
        requests.push_back(fen);
        depths.push_back(settings.effectiveDepth());
        if (replies.empty()) {
            throw EngineException("No reply scripted");
        }
        std::string reply = replies.front();
        replies.pop_front();
        return reply;
    }

    std::deque<std::string> replies;
    std::vector<std::string> requests;
    std::vector<int> depths;
};

// Answers each command from a script, as a UCI engine process would
class FakeTransport : public IUciTransport {
public:
    void writeLine(const std::string& line) override {
        written.push_back(line);
        if (line == "uci") {
            pending.push_back("id name FakeFish");
            pending.push_back("uciok");
        } else if (line == "isready") {
            pending.push_back("readyok");
        } else if (line.rfind("go", 0) == 0) {
            pending.push_back("info depth 1 score cp 20");
            if (!bestMoves.empty()) {
                pending.push_back(bestMoves.front());
                bestMoves.pop_front();
            }
        }
    }

    std::optional<std::string> readLine() override {
        if (pending.empty()) {
            return std::nullopt;
        }
        std::string line = pending.front();
        pending.pop_front();
        return line;
    }

    std::vector<std::string> written;
    std::deque<std::string> pending;
    std::deque<std::string> bestMoves;
};

} // anonymous namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        game.configureBot(false);
    }

    game::ChessGame game;
    FakeEngine engine;
    FakeTransport transport;
};

TEST_F(EngineTest, DifficultyPresets) {
    EXPECT_EQ(difficultyPreset(BotDifficulty::EASY).depth, 1);
    EXPECT_EQ(difficultyPreset(BotDifficulty::MEDIUM).movetime_ms, 200);
    EXPECT_EQ(difficultyPreset(BotDifficulty::HARD).elo, 2100);
    EXPECT_EQ(difficultyPreset(BotDifficulty::MAGNUS).depth, 12);

    EXPECT_EQ(difficultyFromName("hard"), BotDifficulty::HARD);
    EXPECT_EQ(difficultyFromName("Magnus"), BotDifficulty::MAGNUS);
    EXPECT_FALSE(difficultyFromName("grandmaster").has_value());
}

TEST_F(EngineTest, EngineSettings) {
    EngineSettings settings;
    EXPECT_EQ(settings.effectiveDepth(), EngineSettings::DEFAULT_DEPTH);
    EXPECT_FALSE(settings.movetimeMs().has_value());
    EXPECT_FALSE(settings.elo().has_value());

    settings.depth = 6;
    EXPECT_EQ(settings.effectiveDepth(), 6);

    // A preset overrides the plain depth
    settings.difficulty = BotDifficulty::MEDIUM;
    EXPECT_EQ(settings.effectiveDepth(), 4);
    EXPECT_EQ(settings.movetimeMs(), 200);
    EXPECT_EQ(settings.elo(), 1700);
}

TEST_F(EngineTest, UciCommands) {
    EXPECT_EQ(UciProtocol::goCommand(10, std::nullopt), "go depth 10");
    EXPECT_EQ(UciProtocol::goCommand(1, 50), "go depth 1 movetime 50");
    EXPECT_EQ(UciProtocol::positionCommand(notation::FenCodec::INITIAL_FEN),
              "position fen " + notation::FenCodec::INITIAL_FEN);
    EXPECT_EQ(UciProtocol::setOptionCommand("UCI_Elo", "1350"), "setoption name UCI_Elo value 1350");
}

TEST_F(EngineTest, ParseBestMove) {
    EXPECT_TRUE(UciProtocol::isBestMoveLine("bestmove e2e4 ponder e7e5"));
    EXPECT_FALSE(UciProtocol::isBestMoveLine("info depth 3"));

    EXPECT_EQ(UciProtocol::parseBestMove("bestmove e2e4 ponder e7e5"), std::optional<std::string>("e2e4"));
    EXPECT_EQ(UciProtocol::parseBestMove("bestmove a7a8q"), std::optional<std::string>("a7a8q"));
    EXPECT_FALSE(UciProtocol::parseBestMove("bestmove (none)").has_value());
    EXPECT_FALSE(UciProtocol::parseBestMove("bestmove 0000").has_value());
    EXPECT_FALSE(UciProtocol::parseBestMove("bestmove").has_value());
    EXPECT_FALSE(UciProtocol::parseBestMove("info bestmove").has_value());
}

TEST_F(EngineTest, UciSession) {
    UciEngine uci(transport);
    transport.bestMoves.push_back("bestmove e2e4");
    transport.bestMoves.push_back("bestmove d2d4");

    EngineSettings settings;
    settings.difficulty = BotDifficulty::EASY;
    EXPECT_EQ(uci.bestMove(notation::FenCodec::INITIAL_FEN, settings), "e2e4");

    std::vector<std::string> expected = {
        "uci",
        "setoption name UCI_LimitStrength value true",
        "setoption name UCI_Elo value 1350",
        "isready",
        "position fen " + notation::FenCodec::INITIAL_FEN,
        "go depth 1 movetime 50"
    };
    EXPECT_EQ(transport.written, expected);

    // No second handshake and no repeated strength options
    transport.written.clear();
    EXPECT_EQ(uci.bestMove(notation::FenCodec::INITIAL_FEN, settings), "d2d4");
    ASSERT_EQ(transport.written.size(), 3u);
    EXPECT_EQ(transport.written[0], "isready");

    uci.quit();
    EXPECT_EQ(transport.written.back(), "quit");
}

TEST_F(EngineTest, UciFailures) {
    UciEngine uci(transport);
    EngineSettings settings;

    // Engine stops answering before bestmove
    EXPECT_THROW(uci.bestMove(notation::FenCodec::INITIAL_FEN, settings), EngineException);

    transport.bestMoves.push_back("bestmove (none)");
    EXPECT_THROW(uci.bestMove(notation::FenCodec::INITIAL_FEN, settings), EngineException);
}

TEST_F(EngineTest, BotPlaysItsTurn) {
    engine.replies.push_back("e7e5");
    BotOpponent bot(engine, EngineSettings(), PieceColor::BLACK);

    EXPECT_FALSE(bot.isBotTurn(game));
    EXPECT_THROW(bot.playTurn(game), EngineException);

    ASSERT_TRUE(game.playMove(sq("e2"), sq("e4")).has_value());
    EXPECT_TRUE(bot.isBotTurn(game));

    core::PieceMove move = bot.playTurn(game);
    EXPECT_EQ(move.from, sq("e7"));
    EXPECT_EQ(move.to, sq("e5"));
    EXPECT_EQ(game.turn(), PieceColor::WHITE);

    ASSERT_EQ(engine.requests.size(), 1u);
    EXPECT_EQ(engine.requests[0], "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    EXPECT_EQ(engine.depths[0], EngineSettings::DEFAULT_DEPTH);
}

TEST_F(EngineTest, BotRejectsIllegalReply) {
    engine.replies.push_back("e7e4");
    BotOpponent bot(engine, EngineSettings(), PieceColor::BLACK);
    ASSERT_TRUE(game.playMove(sq("e2"), sq("e4")).has_value());

    EXPECT_THROW(bot.playTurn(game), EngineException);
    EXPECT_EQ(game.turn(), PieceColor::BLACK);
    EXPECT_EQ(game.gameBoard().moveHistory().size(), 1u);
}

TEST_F(EngineTest, BotPromotesToQueenByDefault) {
    core::Board board;
    board.set(sq("e8"), core::Piece(PieceType::KING, PieceColor::WHITE));
    board.set(sq("h1"), core::Piece(PieceType::KING, PieceColor::BLACK));
    board.set(sq("b2"), core::Piece(PieceType::PAWN, PieceColor::BLACK));
    game::ChessGame session(game::GameBoard(board), PieceColor::BLACK);

    engine.replies.push_back("b2b1");
    BotOpponent bot(engine, EngineSettings(), PieceColor::BLACK);
    core::PieceMove move = bot.playTurn(session);

    EXPECT_EQ(move.promotion, PieceType::QUEEN);
    EXPECT_EQ(session.gameBoard().board().pieceTypeAt(sq("b1")), PieceType::QUEEN);
    EXPECT_EQ(session.state(), game::GameState::PLAYING);
}

} // namespace adapters
} // namespace chesscore
