// include/chesscore/core/zobrist_hash.h
#ifndef CHESSCORE_ZOBRIST_HASH_H
#define CHESSCORE_ZOBRIST_HASH_H

#include <vector>
#include <cstdint>
#include <random>
#include "chesscore/core/board.h"

namespace chesscore {
namespace core {

/**
 * @brief Zobrist hashing for board layouts
 *
 * One random key per (piece kind, color, square). Only piece placement is
 * hashed: side to move, castling and en passant rights are not part of the
 * key, matching how repeated positions are counted.
 */
class ZobristHash {
public:
    static constexpr int NUM_PIECES = 12;  // 6 piece types * 2 colors
    static constexpr int NUM_SQUARES = BOARD_SIZE * BOARD_SIZE;
    static constexpr uint64_t DEFAULT_SEED = 0x5eedc4e55ULL;

    /**
     * @brief Constructor
     *
     * @param seed Random seed for deterministic initialization
     */
    explicit ZobristHash(uint64_t seed = DEFAULT_SEED);

    /**
     * @brief Get hash value for a piece on a square
     *
     * @param piece The piece
     * @param coord A valid board coordinate
     * @return 64-bit hash value
     * @throws std::out_of_range for an invalid coordinate
     */
    uint64_t getPieceHash(const Piece& piece, const Coord& coord) const;

    /**
     * @brief Hash the placement of every piece on a board
     */
    uint64_t hashBoard(const Board& board) const;

    /**
     * @brief Process-wide default table
     */
    static const ZobristHash& instance();

private:
    std::vector<std::vector<uint64_t>> pieceHashes_;  // [piece index][square]

    static int pieceIndex(const Piece& piece);
    static uint64_t generateRandomHash(std::mt19937_64& rng);
};

/**
 * @brief Hash functor so boards can key unordered containers
 */
struct BoardHasher {
    size_t operator()(const Board& board) const {
        return static_cast<size_t>(ZobristHash::instance().hashBoard(board));
    }
};

} // namespace core
} // namespace chesscore

#endif // CHESSCORE_ZOBRIST_HASH_H
