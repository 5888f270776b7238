// src/adapters/engine.cpp
#include "chesscore/adapters/engine.h"
#include "chesscore/core/exceptions.h"
#include "chesscore/notation/fen.h"
#include "chesscore/notation/move_codec.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

namespace chesscore {
namespace adapters {

using core::EngineException;

const std::array<DifficultyPreset, 4> DIFFICULTY_PRESETS = {{
    {"Easy",   1,  50,   1350},
    {"Medium", 4,  200,  1700},
    {"Hard",   8,  500,  2100},
    {"Magnus", 12, 1500, 2800}
}};

const DifficultyPreset& difficultyPreset(BotDifficulty difficulty) {
    return DIFFICULTY_PRESETS[static_cast<size_t>(difficulty)];
}

std::optional<BotDifficulty> difficultyFromName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (size_t i = 0; i < DIFFICULTY_PRESETS.size(); ++i) {
        std::string preset = DIFFICULTY_PRESETS[i].name;
        std::transform(preset.begin(), preset.end(), preset.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (preset == lower) {
            return static_cast<BotDifficulty>(i);
        }
    }
    return std::nullopt;
}

int EngineSettings::effectiveDepth() const {
    return difficulty ? difficultyPreset(*difficulty).depth : depth;
}

std::optional<int> EngineSettings::movetimeMs() const {
    if (!difficulty) {
        return std::nullopt;
    }
    return difficultyPreset(*difficulty).movetime_ms;
}

std::optional<int> EngineSettings::elo() const {
    if (!difficulty) {
        return std::nullopt;
    }
    return difficultyPreset(*difficulty).elo;
}

// UciProtocol

std::string UciProtocol::setOptionCommand(const std::string& name, const std::string& value) {
    return "setoption name " + name + " value " + value;
}

std::string UciProtocol::positionCommand(const std::string& fen) {
    return "position fen " + fen;
}

std::string UciProtocol::goCommand(int depth, std::optional<int> movetimeMs) {
    std::string command = "go depth " + std::to_string(depth);
    if (movetimeMs) {
        command += " movetime " + std::to_string(*movetimeMs);
    }
    return command;
}

bool UciProtocol::isBestMoveLine(const std::string& line) {
    return notation::MoveCodec::trim(line).rfind("bestmove", 0) == 0;
}

std::optional<std::string> UciProtocol::parseBestMove(const std::string& line) {
    std::istringstream iss(line);
    std::string keyword;
    std::string move;
    if (!(iss >> keyword >> move) || keyword != "bestmove") {
        return std::nullopt;
    }
    if (move == "(none)" || move == "0000") {
        return std::nullopt;
    }
    return move;
}

// UciEngine

UciEngine::UciEngine(IUciTransport& transport)
    : transport_(transport) {
}

std::string UciEngine::waitFor(const std::string& prefix) {
    while (true) {
        auto line = transport_.readLine();
        if (!line) {
            throw EngineException("Engine closed the connection while waiting for '" + prefix + "'");
        }
        std::string trimmed = notation::MoveCodec::trim(*line);
        if (trimmed.rfind(prefix, 0) == 0) {
            return trimmed;
        }
        spdlog::trace("UciEngine: {}", trimmed);
    }
}

void UciEngine::handshake() {
    transport_.writeLine(UciProtocol::uciCommand());
    waitFor("uciok");
    initialized_ = true;
    spdlog::debug("UciEngine: Handshake complete");
}

void UciEngine::configureStrength(const EngineSettings& settings) {
    auto elo = settings.elo();
    if (elo == configured_elo_) {
        return;
    }

    if (elo) {
        transport_.writeLine(UciProtocol::setOptionCommand("UCI_LimitStrength", "true"));
        transport_.writeLine(UciProtocol::setOptionCommand("UCI_Elo", std::to_string(*elo)));
        spdlog::info("UciEngine: Limiting strength to Elo {}", *elo);
    } else {
        transport_.writeLine(UciProtocol::setOptionCommand("UCI_LimitStrength", "false"));
    }
    configured_elo_ = elo;
}

std::string UciEngine::bestMove(const std::string& fen, const EngineSettings& settings) {
    if (!initialized_) {
        handshake();
    }
    configureStrength(settings);

    transport_.writeLine(UciProtocol::isReadyCommand());
    waitFor("readyok");

    transport_.writeLine(UciProtocol::positionCommand(fen));
    transport_.writeLine(UciProtocol::goCommand(settings.effectiveDepth(), settings.movetimeMs()));

    std::string reply = waitFor("bestmove");
    auto move = UciProtocol::parseBestMove(reply);
    if (!move) {
        throw EngineException("Engine returned no move: " + reply);
    }
    return *move;
}

void UciEngine::quit() {
    if (initialized_) {
        transport_.writeLine(UciProtocol::quitCommand());
        initialized_ = false;
        configured_elo_.reset();
    }
}

// BotOpponent

BotOpponent::BotOpponent(IMoveEngine& engine, EngineSettings settings, core::PieceColor color)
    : engine_(engine), settings_(settings), color_(color) {
}

bool BotOpponent::isBotTurn(const game::ChessGame& game) const {
    return game.state() == game::GameState::PLAYING && !game.isViewingHistory() && game.turn() == color_;
}

core::PieceMove BotOpponent::playTurn(game::ChessGame& game) {
    if (!isBotTurn(game)) {
        throw EngineException("Engine asked to move out of turn");
    }

    std::string fen = notation::FenCodec::toFen(game.gameBoard(), game.turn());
    spdlog::debug("BotOpponent: Requesting move for {}", fen);

    std::string move = engine_.bestMove(fen, settings_);
    if (!game.applyEngineMove(move)) {
        throw EngineException("Engine returned an unusable move: '" + move + "'");
    }

    auto played = game.gameBoard().lastMove();
    if (!played) {
        throw EngineException("Engine move was not recorded: '" + move + "'");
    }

    spdlog::info("BotOpponent: Played {}", move);
    return *played;
}

} // namespace adapters
} // namespace chesscore
