// src/core/zobrist_hash.cpp
#include "chesscore/core/zobrist_hash.h"
#include <stdexcept>

namespace chesscore {
namespace core {

ZobristHash::ZobristHash(uint64_t seed) {
    std::mt19937_64 rng(seed);

    // Initialize hash values for pieces at positions
    pieceHashes_.resize(NUM_PIECES);
    for (int p = 0; p < NUM_PIECES; ++p) {
        pieceHashes_[p].resize(NUM_SQUARES);
        for (int pos = 0; pos < NUM_SQUARES; ++pos) {
            pieceHashes_[p][pos] = generateRandomHash(rng);
        }
    }
}

uint64_t ZobristHash::getPieceHash(const Piece& piece, const Coord& coord) const {
    if (!coord.isValid()) {
        throw std::out_of_range("Square index out of range");
    }
    return pieceHashes_[pieceIndex(piece)][coord.row * BOARD_SIZE + coord.col];
}

uint64_t ZobristHash::hashBoard(const Board& board) const {
    uint64_t hash = 0;
    for (int row = 0; row < BOARD_SIZE; ++row) {
        for (int col = 0; col < BOARD_SIZE; ++col) {
            Coord coord(row, col);
            if (auto piece = board.at(coord)) {
                hash ^= getPieceHash(*piece, coord);
            }
        }
    }
    return hash;
}

const ZobristHash& ZobristHash::instance() {
    static const ZobristHash table;
    return table;
}

int ZobristHash::pieceIndex(const Piece& piece) {
    int index = static_cast<int>(piece.type);
    if (piece.color == PieceColor::BLACK) {
        index += 6;  // Offset for black pieces
    }
    return index;
}

uint64_t ZobristHash::generateRandomHash(std::mt19937_64& rng) {
    return rng();
}

} // namespace core
} // namespace chesscore
