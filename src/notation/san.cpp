// src/notation/san.cpp
#include "chesscore/notation/san.h"
#include "chesscore/core/exceptions.h"
#include "chesscore/game/game_oracle.h"
#include "chesscore/game/move_executor.h"
#include "chesscore/rules/board_update.h"
#include "chesscore/rules/chess_rules.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace chesscore {
namespace notation {

using core::Board;
using core::Coord;
using core::PgnParseException;
using core::PieceColor;
using core::PieceType;
using rules::ChessRules;

namespace {

bool canReach(const game::GameBoard& gameBoard, const Coord& from, const Coord& to) {
    auto moves = ChessRules::legalMoves(gameBoard.board(), gameBoard.rulesHistory(), from);
    return std::find(moves.begin(), moves.end(), to) != moves.end();
}

std::optional<PieceType> sanPieceFromChar(char c) {
    switch (c) {
        case 'N': return PieceType::KNIGHT;
        case 'B': return PieceType::BISHOP;
        case 'R': return PieceType::ROOK;
        case 'Q': return PieceType::QUEEN;
        case 'K': return PieceType::KING;
        default:  return std::nullopt;
    }
}

std::string disambiguation(const game::GameBoard& gameBoard, const Coord& from, const Coord& to,
                           const core::Piece& piece) {
    const Board& board = gameBoard.board();
    bool ambiguous = false;
    bool sameFile = false;
    bool sameRank = false;

    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        for (int col = 0; col < core::BOARD_SIZE; ++col) {
            Coord other(row, col);
            if (other == from || board.at(other) != piece) {
                continue;
            }
            if (!canReach(gameBoard, other, to)) {
                continue;
            }
            ambiguous = true;
            sameFile = sameFile || other.col == from.col;
            sameRank = sameRank || other.row == from.row;
        }
    }

    if (!ambiguous) {
        return "";
    }

    std::string square = from.toAlgebraic();
    if (!sameFile) {
        return square.substr(0, 1);
    }
    if (!sameRank) {
        return square.substr(1, 1);
    }
    return square;
}

} // anonymous namespace

std::string SanCodec::stripAnnotations(const std::string& token) {
    std::string text = token;
    while (!text.empty() &&
           (text.back() == '+' || text.back() == '#' || text.back() == '!' || text.back() == '?')) {
        text.pop_back();
    }
    return text;
}

std::string SanCodec::toSan(
    const game::GameBoard& gameBoard,
    const Coord& from,
    const Coord& to,
    std::optional<PieceType> promotion) {

    const Board& board = gameBoard.board();
    auto piece = board.at(from);
    if (!piece || !to.isValid()) {
        return "";
    }

    std::string san;
    if (piece->type == PieceType::KING && rules::BoardUpdate::isCastlingShape(board, from, to)) {
        san = to.col > from.col ? "O-O" : "O-O-O";
    } else {
        auto target = board.at(to);
        bool capture = (target && target->color != piece->color) ||
                       rules::BoardUpdate::isEnPassantShape(board, from, to);

        if (piece->type == PieceType::PAWN) {
            if (capture) {
                san += from.toAlgebraic().substr(0, 1);
                san += 'x';
            }
            san += to.toAlgebraic();
            if (promotion) {
                san += '=';
                san += core::sanPieceChar(*promotion);
            }
        } else {
            san += core::sanPieceChar(piece->type);
            san += disambiguation(gameBoard, from, to, *piece);
            if (capture) {
                san += 'x';
            }
            san += to.toAlgebraic();
        }
    }

    // Check and mate marks come from the resulting position
    game::GameBoard after = gameBoard;
    after.goLive();
    if (!game::MoveExecutor::execute(after, from, to)) {
        return san;
    }
    if (promotion && !game::MoveExecutor::promote(after, *promotion)) {
        return san;
    }

    PieceColor opponent = core::oppositeColor(piece->color);
    if (game::GameOracle::isCheckmate(after, opponent)) {
        san += '#';
    } else if (game::GameOracle::isInCheck(after, opponent)) {
        san += '+';
    }
    return san;
}

MoveText SanCodec::resolve(
    const game::GameBoard& gameBoard,
    const std::string& token,
    PieceColor turn) {

    const Board& board = gameBoard.board();
    std::string san = stripAnnotations(token);
    if (san.empty()) {
        throw PgnParseException(token, "empty move");
    }

    // Castling
    bool kingside = san == "O-O" || san == "0-0";
    bool queenside = san == "O-O-O" || san == "0-0-0";
    if (kingside || queenside) {
        Coord king = board.kingCoordinates(turn);
        Coord destination(king.row, kingside ? 6 : 2);
        if (!king.isValid() || !canReach(gameBoard, king, destination)) {
            throw PgnParseException(token, "castling is not allowed");
        }
        return MoveText{king, destination, std::nullopt};
    }

    // Promotion suffix, "e8=Q" or "e8Q"
    std::optional<PieceType> promotion;
    size_t equals = san.find('=');
    if (equals != std::string::npos) {
        if (equals + 1 >= san.size() || !(promotion = core::promotionFromChar(san[equals + 1]))) {
            throw PgnParseException(token, "invalid promotion piece");
        }
        san = san.substr(0, equals);
    } else if (san.size() >= 3 && std::isdigit(static_cast<unsigned char>(san[san.size() - 2])) &&
               core::promotionFromChar(san.back())) {
        promotion = core::promotionFromChar(san.back());
        san.pop_back();
    }

    // Piece kind
    PieceType type = PieceType::PAWN;
    std::string rest = san;
    if (auto pieceType = sanPieceFromChar(san[0])) {
        type = *pieceType;
        rest = san.substr(1);
    }

    rest.erase(std::remove_if(rest.begin(), rest.end(), [](char c) {
        return c == 'x' || c == ':' || c == '-';
    }), rest.end());

    if (rest.size() < 2) {
        throw PgnParseException(token, "missing destination square");
    }

    auto destination = Coord::fromAlgebraic(rest.substr(rest.size() - 2));
    if (!destination) {
        throw PgnParseException(token, "invalid destination square");
    }

    // Origin hints
    std::optional<int> fileHint;
    std::optional<int> rankHint;
    for (char c : rest.substr(0, rest.size() - 2)) {
        if (c >= 'a' && c <= 'h') {
            fileHint = c - 'a';
        } else if (c >= '1' && c <= '8') {
            rankHint = '8' - c;
        } else {
            throw PgnParseException(token, std::string("unexpected character '") + c + "'");
        }
    }

    std::vector<Coord> candidates;
    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        for (int col = 0; col < core::BOARD_SIZE; ++col) {
            Coord from(row, col);
            auto piece = board.at(from);
            if (!piece || piece->type != type || piece->color != turn) {
                continue;
            }
            if ((fileHint && *fileHint != col) || (rankHint && *rankHint != row)) {
                continue;
            }
            if (canReach(gameBoard, from, *destination)) {
                candidates.push_back(from);
            }
        }
    }

    if (candidates.empty()) {
        throw PgnParseException(token, "no legal move matches");
    }
    if (candidates.size() > 1) {
        throw PgnParseException(token, "ambiguous move");
    }

    bool lastRow = destination->row == rules::PieceMovement::promotionRow(turn);
    if (type == PieceType::PAWN && lastRow && !promotion) {
        throw PgnParseException(token, "missing promotion piece");
    }
    if (promotion && (type != PieceType::PAWN || !lastRow)) {
        throw PgnParseException(token, "promotion is not possible here");
    }

    return MoveText{candidates.front(), *destination, promotion};
}

} // namespace notation
} // namespace chesscore
