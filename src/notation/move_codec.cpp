// src/notation/move_codec.cpp
#include "chesscore/notation/move_codec.h"
#include <cctype>

namespace chesscore {
namespace notation {

using core::Coord;

const std::string MoveCodec::END_TOKEN = "ended";

std::string MoveCodec::trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<MoveText> MoveCodec::parseEngineMove(const std::string& text) {
    std::string move = trim(text);
    if (move.size() != 4 && move.size() != 5) {
        return std::nullopt;
    }

    auto from = Coord::fromAlgebraic(move.substr(0, 2));
    auto to = Coord::fromAlgebraic(move.substr(2, 2));
    if (!from || !to) {
        return std::nullopt;
    }

    MoveText result{*from, *to, std::nullopt};
    if (move.size() == 5) {
        result.promotion = core::promotionFromChar(move[4]);
        if (!result.promotion) {
            return std::nullopt;
        }
    }
    return result;
}

std::string MoveCodec::formatEngineMove(const MoveText& move) {
    std::string text = move.from.toAlgebraic() + move.to.toAlgebraic();
    if (move.promotion) {
        char letter = core::promotionChar(*move.promotion);
        if (letter != 0) {
            text += letter;
        }
    }
    return text;
}

std::optional<MoveText> MoveCodec::parseNetworkToken(const std::string& token) {
    std::string move = trim(token);
    if (move.size() != 4 && move.size() != 5) {
        return std::nullopt;
    }

    int digits[4];
    for (int i = 0; i < 4; ++i) {
        if (move[i] < '0' || move[i] >= '0' + core::BOARD_SIZE) {
            return std::nullopt;
        }
        digits[i] = move[i] - '0';
    }

    MoveText result{Coord(digits[0], digits[1]), Coord(digits[2], digits[3]), std::nullopt};
    if (move.size() == 5) {
        result.promotion = core::promotionFromChar(move[4]);
        if (!result.promotion) {
            return std::nullopt;
        }
    }
    return result;
}

std::string MoveCodec::formatNetworkToken(const MoveText& move) {
    std::string text;
    text += static_cast<char>('0' + move.from.row);
    text += static_cast<char>('0' + move.from.col);
    text += static_cast<char>('0' + move.to.row);
    text += static_cast<char>('0' + move.to.col);
    if (move.promotion) {
        char letter = core::promotionChar(*move.promotion);
        if (letter != 0) {
            text += letter;
        }
    }
    return text;
}

bool MoveCodec::isEndToken(const std::string& token) {
    std::string text = trim(token);
    return text.empty() || text == END_TOKEN;
}

} // namespace notation
} // namespace chesscore
