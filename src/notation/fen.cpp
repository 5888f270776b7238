// src/notation/fen.cpp
#include "chesscore/notation/fen.h"
#include "chesscore/core/exceptions.h"
#include "chesscore/rules/chess_rules.h"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace chesscore {
namespace notation {

using core::Board;
using core::Coord;
using core::FenParseException;
using core::PieceColor;
using core::PieceType;
using rules::ChessRules;

const std::string FenCodec::INITIAL_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

namespace {

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

int parseCounter(const std::string& field, const std::string& name) {
    if (field.empty()) {
        throw FenParseException("FEN " + name + " is empty");
    }
    for (char c : field) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw FenParseException("FEN " + name + " is not a number: " + field);
        }
    }
    return std::atoi(field.c_str());
}

} // anonymous namespace

std::string FenCodec::placement(const Board& board) {
    std::stringstream fen;

    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        int emptyCount = 0;

        for (int col = 0; col < core::BOARD_SIZE; ++col) {
            auto piece = board.at(Coord(row, col));

            if (!piece) {
                emptyCount++;
            } else {
                if (emptyCount > 0) {
                    fen << emptyCount;
                    emptyCount = 0;
                }
                fen << core::pieceToFenChar(*piece);
            }
        }

        if (emptyCount > 0) {
            fen << emptyCount;
        }

        if (row < core::BOARD_SIZE - 1) {
            fen << '/';
        }
    }

    return fen.str();
}

std::string FenCodec::toFen(const game::GameBoard& gameBoard, PieceColor turn, int startFullmove) {
    const Board& board = gameBoard.board();
    const rules::MoveHistory& history = gameBoard.moveHistory();
    const rules::MoveHistory rulesHistory = gameBoard.rulesHistory();

    std::stringstream fen;

    // 1. Piece placement
    fen << placement(board) << ' ';

    // 2. Active color
    fen << (turn == PieceColor::WHITE ? 'w' : 'b') << ' ';

    // 3. Castling availability
    std::string castling;
    if (ChessRules::hasCastlingRight(board, rulesHistory, PieceColor::WHITE, true)) castling += 'K';
    if (ChessRules::hasCastlingRight(board, rulesHistory, PieceColor::WHITE, false)) castling += 'Q';
    if (ChessRules::hasCastlingRight(board, rulesHistory, PieceColor::BLACK, true)) castling += 'k';
    if (ChessRules::hasCastlingRight(board, rulesHistory, PieceColor::BLACK, false)) castling += 'q';
    fen << (castling.empty() ? "-" : castling) << ' ';

    // 4. En passant target square
    std::string enPassant = "-";
    if (!rulesHistory.empty()) {
        const core::PieceMove& last = rulesHistory.back();
        if (last.piece_type == PieceType::PAWN && std::abs(last.from.row - last.to.row) == 2) {
            enPassant = Coord((last.from.row + last.to.row) / 2, last.to.col).toAlgebraic();
        }
    }
    fen << enPassant << ' ';

    // 5. Halfmove clock
    fen << gameBoard.consecutiveNonPawnOrCapture() << ' ';

    // 6. Fullmove number, counted from the side that made the first move
    int moves = static_cast<int>(history.size());
    PieceColor startingTurn = moves % 2 == 0 ? turn : core::oppositeColor(turn);
    int blackOffset = startingTurn == PieceColor::BLACK ? 1 : 0;
    fen << startFullmove + (moves + blackOffset) / 2;

    return fen.str();
}

Board FenCodec::parseBoard(const std::string& placementField) {
    std::vector<std::string> ranks = split(placementField, '/');
    if (ranks.size() != core::BOARD_SIZE) {
        throw FenParseException("FEN placement must have 8 ranks: " + placementField);
    }

    Board board;
    for (int row = 0; row < core::BOARD_SIZE; ++row) {
        int col = 0;
        for (char c : ranks[row]) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                int run = c - '0';
                if (run < 1 || run > core::BOARD_SIZE) {
                    throw FenParseException(std::string("Invalid empty run in FEN: ") + c);
                }
                col += run;
            } else {
                auto piece = core::pieceFromFenChar(c);
                if (!piece) {
                    throw FenParseException(std::string("Invalid piece letter in FEN: ") + c);
                }
                if (col >= core::BOARD_SIZE) {
                    throw FenParseException("FEN rank too long: " + ranks[row]);
                }
                board.set(Coord(row, col), *piece);
                col++;
            }
            if (col > core::BOARD_SIZE) {
                throw FenParseException("FEN rank too long: " + ranks[row]);
            }
        }
        if (col != core::BOARD_SIZE) {
            throw FenParseException("FEN rank too short: " + ranks[row]);
        }
    }

    return board;
}

FenPosition FenCodec::parse(const std::string& fen) {
    std::istringstream iss(fen);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }

    if (fields.size() < 2 || fields.size() > 6) {
        throw FenParseException("FEN must have between 2 and 6 fields: " + fen);
    }

    FenPosition position;
    position.board = parseBoard(fields[0]);

    if (fields[1] == "w") {
        position.turn = PieceColor::WHITE;
    } else if (fields[1] == "b") {
        position.turn = PieceColor::BLACK;
    } else {
        throw FenParseException("Invalid FEN active color: " + fields[1]);
    }

    if (fields.size() > 2) {
        game::StartRights& rights = position.rights;
        rights.white_kingside = rights.white_queenside = false;
        rights.black_kingside = rights.black_queenside = false;
        if (fields[2] != "-") {
            for (char c : fields[2]) {
                switch (c) {
                    case 'K': rights.white_kingside = true; break;
                    case 'Q': rights.white_queenside = true; break;
                    case 'k': rights.black_kingside = true; break;
                    case 'q': rights.black_queenside = true; break;
                    default:
                        throw FenParseException("Invalid FEN castling field: " + fields[2]);
                }
            }
        }
    }

    if (fields.size() > 3 && fields[3] != "-") {
        auto square = Coord::fromAlgebraic(fields[3]);
        if (!square || (square->row != 2 && square->row != 5)) {
            throw FenParseException("Invalid FEN en passant square: " + fields[3]);
        }
        position.rights.en_passant = square;
    }

    if (fields.size() > 4) {
        position.halfmove_clock = parseCounter(fields[4], "halfmove clock");
    }
    if (fields.size() > 5) {
        position.fullmove_number = parseCounter(fields[5], "fullmove number");
        if (position.fullmove_number < 1) {
            throw FenParseException("FEN fullmove number must be positive");
        }
    }

    return position;
}

game::GameBoard FenCodec::toGameBoard(const FenPosition& position) {
    game::GameBoard gameBoard(position.board, position.halfmove_clock);
    gameBoard.setStartRights(position.rights);
    return gameBoard;
}

} // namespace notation
} // namespace chesscore
