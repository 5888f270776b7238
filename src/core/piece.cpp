// src/core/piece.cpp
#include "chesscore/core/piece.h"
#include <cctype>

namespace chesscore {
namespace core {

int pieceRank(PieceType type) {
    switch (type) {
        case PieceType::PAWN:   return 1;
        case PieceType::KNIGHT: return 2;
        case PieceType::BISHOP: return 2;
        case PieceType::ROOK:   return 3;
        case PieceType::QUEEN:  return 4;
        case PieceType::KING:   return 5;
    }
    return 0;
}

char pieceToFenChar(const Piece& piece) {
    char pieceChar = '?';
    switch (piece.type) {
        case PieceType::PAWN:   pieceChar = 'p'; break;
        case PieceType::KNIGHT: pieceChar = 'n'; break;
        case PieceType::BISHOP: pieceChar = 'b'; break;
        case PieceType::ROOK:   pieceChar = 'r'; break;
        case PieceType::QUEEN:  pieceChar = 'q'; break;
        case PieceType::KING:   pieceChar = 'k'; break;
    }

    if (piece.color == PieceColor::WHITE) {
        pieceChar = static_cast<char>(std::toupper(static_cast<unsigned char>(pieceChar)));
    }
    return pieceChar;
}

std::optional<Piece> pieceFromFenChar(char c) {
    PieceType type;
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'p': type = PieceType::PAWN; break;
        case 'n': type = PieceType::KNIGHT; break;
        case 'b': type = PieceType::BISHOP; break;
        case 'r': type = PieceType::ROOK; break;
        case 'q': type = PieceType::QUEEN; break;
        case 'k': type = PieceType::KING; break;
        default: return std::nullopt;
    }

    PieceColor color = std::isupper(static_cast<unsigned char>(c)) ? PieceColor::WHITE : PieceColor::BLACK;
    return Piece(type, color);
}

char promotionChar(PieceType type) {
    switch (type) {
        case PieceType::QUEEN:  return 'q';
        case PieceType::ROOK:   return 'r';
        case PieceType::BISHOP: return 'b';
        case PieceType::KNIGHT: return 'n';
        default: return 0;
    }
}

std::optional<PieceType> promotionFromChar(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'q': return PieceType::QUEEN;
        case 'r': return PieceType::ROOK;
        case 'b': return PieceType::BISHOP;
        case 'n': return PieceType::KNIGHT;
        default: return std::nullopt;
    }
}

char sanPieceChar(PieceType type) {
    switch (type) {
        case PieceType::KNIGHT: return 'N';
        case PieceType::BISHOP: return 'B';
        case PieceType::ROOK:   return 'R';
        case PieceType::QUEEN:  return 'Q';
        case PieceType::KING:   return 'K';
        default: return 0;
    }
}

std::string pieceTypeName(PieceType type) {
    switch (type) {
        case PieceType::PAWN:   return "Pawn";
        case PieceType::KNIGHT: return "Knight";
        case PieceType::BISHOP: return "Bishop";
        case PieceType::ROOK:   return "Rook";
        case PieceType::QUEEN:  return "Queen";
        case PieceType::KING:   return "King";
    }
    return "?";
}

std::string colorName(PieceColor color) {
    return color == PieceColor::WHITE ? "White" : "Black";
}

} // namespace core
} // namespace chesscore
