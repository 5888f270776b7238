// src/notation/pgn.cpp
#include "chesscore/notation/pgn.h"
#include "chesscore/core/exceptions.h"
#include "chesscore/game/move_executor.h"
#include "chesscore/notation/fen.h"
#include "chesscore/notation/san.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace chesscore {
namespace notation {

using core::PgnParseException;
using core::PieceColor;

namespace {

const char* const SEVEN_TAG_ROSTER[] = {
    "Event", "Site", "Date", "Round", "White", "Black", "Result"
};

std::string trimCopy(const std::string& text) {
    return MoveCodec::trim(text);
}

// [Tag "value"]
void parseHeaderLine(const std::string& line, std::map<std::string, std::string>& headers) {
    size_t open = line.find('[');
    size_t close = line.rfind(']');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return;
    }

    std::string body = trimCopy(line.substr(open + 1, close - open - 1));
    size_t space = body.find_first_of(" \t");
    if (space == std::string::npos) {
        return;
    }

    std::string tag = body.substr(0, space);
    std::string value = trimCopy(body.substr(space + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    headers[tag] = value;
}

// "12." and "12..." prefixes; "0-0" has no dot and is kept
std::string stripMoveNumber(const std::string& token) {
    size_t pos = 0;
    while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos >= token.size() || token[pos] != '.') {
        return token;
    }
    while (pos < token.size() && token[pos] == '.') {
        ++pos;
    }
    return token.substr(pos);
}

} // anonymous namespace

bool PgnLoader::isResultMarker(const std::string& token) {
    return token == "1-0" || token == "0-1" || token == "1/2-1/2" || token == "*";
}

std::vector<std::string> PgnLoader::tokenize(
    const std::string& text,
    std::map<std::string, std::string>* headers,
    std::optional<std::string>* result) {

    // Header lines first, the rest is move text
    std::map<std::string, std::string> parsedHeaders;
    std::string moveSection;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        std::string trimmed = trimCopy(line);
        if (!trimmed.empty() && trimmed.front() == '[') {
            parseHeaderLine(trimmed, parsedHeaders);
        } else {
            moveSection += line;
            moveSection += '\n';
        }
    }

    // Split on whitespace, dropping comments and variations
    std::vector<std::string> rawTokens;
    std::string current;
    int variationDepth = 0;
    auto flush = [&]() {
        if (!current.empty()) {
            rawTokens.push_back(current);
            current.clear();
        }
    };

    for (size_t i = 0; i < moveSection.size(); ++i) {
        char c = moveSection[i];

        if (c == '{') {
            flush();
            size_t end = moveSection.find('}', i);
            i = end == std::string::npos ? moveSection.size() : end;
        } else if (c == ';') {
            flush();
            size_t end = moveSection.find('\n', i);
            i = end == std::string::npos ? moveSection.size() : end;
        } else if (c == '(') {
            flush();
            variationDepth++;
        } else if (c == ')') {
            flush();
            if (variationDepth > 0) {
                variationDepth--;
            }
        } else if (variationDepth > 0) {
            continue;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    std::vector<std::string> tokens;
    std::optional<std::string> parsedResult;
    for (const auto& raw : rawTokens) {
        if (isResultMarker(raw)) {
            parsedResult = raw;
            continue;
        }

        std::string token = stripMoveNumber(raw);
        if (token.empty() || token.front() == '$' || token == "e.p.") {
            continue;
        }

        token = SanCodec::stripAnnotations(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    if (headers) {
        *headers = parsedHeaders;
    }
    if (result) {
        *result = parsedResult;
    }
    return tokens;
}

PgnGame PgnLoader::parse(const std::string& text) {
    PgnGame game;
    game.tokens = tokenize(text, &game.headers, &game.result);

    auto fen = game.headers.find("FEN");
    if (fen != game.headers.end()) {
        FenPosition position = FenCodec::parse(fen->second);
        game.game_board = FenCodec::toGameBoard(position);
        game.turn = position.turn;
        game.start_fullmove = position.fullmove_number;
    }

    for (const auto& token : game.tokens) {
        MoveText move = SanCodec::resolve(game.game_board, token, game.turn);

        if (!game::MoveExecutor::execute(game.game_board, move.from, move.to)) {
            throw PgnParseException(token, "move could not be applied");
        }
        if (move.promotion && !game::MoveExecutor::promote(game.game_board, *move.promotion)) {
            throw PgnParseException(token, "promotion could not be applied");
        }

        game.turn = core::oppositeColor(game.turn);
    }

    spdlog::info("PgnLoader: Replayed {} moves, {} to move", game.tokens.size(), core::colorName(game.turn));
    return game;
}

PgnGame PgnLoader::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::ChessException("Could not open PGN file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("PgnLoader: Loading {}", path);
    return parse(buffer.str());
}

std::string PgnWriter::moveText(const game::GameBoard& gameBoard, PieceColor startTurn) {
    const auto& positions = gameBoard.positionHistory();
    const auto& moves = gameBoard.moveHistory();

    game::GameBoard replay(positions.front());
    replay.setStartRights(gameBoard.startRights());
    std::stringstream text;
    PieceColor turn = startTurn;
    int moveNumber = 1;

    for (size_t i = 0; i < moves.size(); ++i) {
        const core::PieceMove& move = moves[i];

        if (turn == PieceColor::WHITE) {
            if (i > 0) text << ' ';
            text << moveNumber << ". ";
        } else if (i == 0) {
            text << moveNumber << "... ";
        } else {
            text << ' ';
        }

        text << SanCodec::toSan(replay, move.from, move.to, move.promotion);

        if (!game::MoveExecutor::execute(replay, move.from, move.to)) {
            break;
        }
        if (move.promotion && !game::MoveExecutor::promote(replay, *move.promotion)) {
            break;
        }

        if (turn == PieceColor::BLACK) {
            moveNumber++;
        }
        turn = core::oppositeColor(turn);
    }

    return text.str();
}

std::string PgnWriter::write(
    const game::GameBoard& gameBoard,
    PieceColor startTurn,
    const std::map<std::string, std::string>& headers,
    const std::string& result) {

    std::map<std::string, std::string> tags = headers;
    tags["Result"] = result;

    const core::Board& start = gameBoard.positionHistory().front();
    if (start != core::Board::initial() || startTurn != PieceColor::WHITE) {
        tags["SetUp"] = "1";
        game::GameBoard startSession(start);
        startSession.setStartRights(gameBoard.startRights());
        tags["FEN"] = FenCodec::toFen(startSession, startTurn);
    }

    std::stringstream pgn;
    for (const char* tag : SEVEN_TAG_ROSTER) {
        auto it = tags.find(tag);
        pgn << '[' << tag << " \"" << (it != tags.end() ? it->second : "?") << "\"]\n";
        if (it != tags.end()) {
            tags.erase(it);
        }
    }
    for (const auto& [tag, value] : tags) {
        pgn << '[' << tag << " \"" << value << "\"]\n";
    }

    pgn << '\n';
    std::string moves = moveText(gameBoard, startTurn);
    if (!moves.empty()) {
        pgn << moves << ' ';
    }
    pgn << result << '\n';

    return pgn.str();
}

bool PgnWriter::saveFile(const std::string& path, const std::string& pgn) {
    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("PgnWriter: Could not open {} for writing", path);
        return false;
    }

    file << pgn;
    return static_cast<bool>(file);
}

} // namespace notation
} // namespace chesscore
