#include <gtest/gtest.h>
#include "chesscore/core/zobrist_hash.h"
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace chesscore {
namespace core {

class ZobristHashTest : public ::testing::Test {
protected:
    void SetUp() override {
        hash = std::make_unique<ZobristHash>(42);
        whiteKnight = Piece(PieceType::KNIGHT, PieceColor::WHITE);
        blackKnight = Piece(PieceType::KNIGHT, PieceColor::BLACK);
    }

    std::unique_ptr<ZobristHash> hash;
    Piece whiteKnight;
    Piece blackKnight;
};

TEST_F(ZobristHashTest, PieceHashing) {
    // Same piece at same square should have same hash
    EXPECT_EQ(hash->getPieceHash(whiteKnight, Coord(7, 1)), hash->getPieceHash(whiteKnight, Coord(7, 1)));

    // Different colors should have different hashes
    EXPECT_NE(hash->getPieceHash(whiteKnight, Coord(7, 1)), hash->getPieceHash(blackKnight, Coord(7, 1)));

    // Same piece at different squares should have different hashes
    EXPECT_NE(hash->getPieceHash(whiteKnight, Coord(7, 1)), hash->getPieceHash(whiteKnight, Coord(7, 6)));
}

TEST_F(ZobristHashTest, HashDistribution) {
    // Every (piece, square) key is unique
    std::unordered_set<uint64_t> hashes;
    const PieceType types[] = {
        PieceType::PAWN, PieceType::KNIGHT, PieceType::BISHOP,
        PieceType::ROOK, PieceType::QUEEN, PieceType::KING
    };

    for (PieceType type : types) {
        for (PieceColor color : {PieceColor::WHITE, PieceColor::BLACK}) {
            for (int row = 0; row < BOARD_SIZE; row++) {
                for (int col = 0; col < BOARD_SIZE; col++) {
                    hashes.insert(hash->getPieceHash(Piece(type, color), Coord(row, col)));
                }
            }
        }
    }

    EXPECT_EQ(hashes.size(), static_cast<size_t>(ZobristHash::NUM_PIECES * ZobristHash::NUM_SQUARES));
}

TEST_F(ZobristHashTest, ErrorHandling) {
    EXPECT_THROW(hash->getPieceHash(whiteKnight, Coord(-1, 0)), std::out_of_range);
    EXPECT_THROW(hash->getPieceHash(whiteKnight, Coord(0, 8)), std::out_of_range);
    EXPECT_THROW(hash->getPieceHash(whiteKnight, Coord::undefined()), std::out_of_range);
}

TEST_F(ZobristHashTest, DeterministicHashing) {
    ZobristHash hash1(7);
    ZobristHash hash2(7);

    EXPECT_EQ(hash1.hashBoard(Board::initial()), hash2.hashBoard(Board::initial()));
    EXPECT_EQ(hash1.getPieceHash(blackKnight, Coord(0, 1)), hash2.getPieceHash(blackKnight, Coord(0, 1)));
}

TEST_F(ZobristHashTest, BoardHashFollowsPlacement) {
    Board empty;
    EXPECT_EQ(hash->hashBoard(empty), 0u);

    Board a = Board::initial();
    Board b = Board::initial();
    EXPECT_EQ(hash->hashBoard(a), hash->hashBoard(b));

    // Moving a knight out and back restores the hash
    b.clear(Coord(7, 6));
    b.set(Coord(5, 5), whiteKnight);
    EXPECT_NE(hash->hashBoard(a), hash->hashBoard(b));

    b.clear(Coord(5, 5));
    b.set(Coord(7, 6), whiteKnight);
    EXPECT_EQ(hash->hashBoard(a), hash->hashBoard(b));
}

TEST_F(ZobristHashTest, BoardsKeyUnorderedMap) {
    std::unordered_map<Board, int, BoardHasher> counts;
    counts[Board::initial()]++;
    counts[Board::initial()]++;
    counts[Board()]++;

    EXPECT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[Board::initial()], 2);
}

} // namespace core
} // namespace chesscore
