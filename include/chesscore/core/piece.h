// include/chesscore/core/piece.h
#ifndef CHESSCORE_PIECE_H
#define CHESSCORE_PIECE_H

#include <optional>
#include <string>
#include "chesscore/core/coord.h"

namespace chesscore {
namespace core {

enum class PieceType {
    PAWN,
    KNIGHT,
    BISHOP,
    ROOK,
    QUEEN,
    KING
};

enum class PieceColor {
    WHITE,
    BLACK
};

/**
 * @brief A piece kind together with its owner
 */
struct Piece {
    PieceType type = PieceType::PAWN;
    PieceColor color = PieceColor::WHITE;

    Piece() = default;
    Piece(PieceType t, PieceColor c) : type(t), color(c) {}

    bool operator==(const Piece& other) const { return type == other.type && color == other.color; }
    bool operator!=(const Piece& other) const { return !(*this == other); }
};

/**
 * @brief One executed move, as kept in the move history
 */
struct PieceMove {
    PieceType piece_type = PieceType::PAWN;
    PieceColor piece_color = PieceColor::WHITE;
    Coord from;
    Coord to;
    std::optional<PieceType> promotion;  // Set once a promotion has been resolved

    PieceMove() = default;
    PieceMove(PieceType type, PieceColor color, const Coord& f, const Coord& t)
        : piece_type(type), piece_color(color), from(f), to(t) {}

    bool operator==(const PieceMove& other) const {
        return piece_type == other.piece_type && piece_color == other.piece_color &&
               from == other.from && to == other.to && promotion == other.promotion;
    }
    bool operator!=(const PieceMove& other) const { return !(*this == other); }
};

inline PieceColor oppositeColor(PieceColor color) {
    return color == PieceColor::WHITE ? PieceColor::BLACK : PieceColor::WHITE;
}

/**
 * @brief Display ranking used to sort captured pieces
 *
 * Knight and bishop share a rank. Not used for move legality.
 */
int pieceRank(PieceType type);

/**
 * @brief FEN letter, uppercase for White and lowercase for Black
 */
char pieceToFenChar(const Piece& piece);

/**
 * @brief Parse a FEN letter
 */
std::optional<Piece> pieceFromFenChar(char c);

/**
 * @brief Lowercase promotion letter (q, r, b, n); 0 for pawn or king
 */
char promotionChar(PieceType type);

/**
 * @brief Parse a promotion letter, either case
 */
std::optional<PieceType> promotionFromChar(char c);

/**
 * @brief Uppercase SAN letter; 0 for pawns
 */
char sanPieceChar(PieceType type);

std::string pieceTypeName(PieceType type);
std::string colorName(PieceColor color);

} // namespace core
} // namespace chesscore

#endif // CHESSCORE_PIECE_H
