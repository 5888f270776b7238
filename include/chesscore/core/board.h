// include/chesscore/core/board.h
#ifndef CHESSCORE_BOARD_H
#define CHESSCORE_BOARD_H

#include <array>
#include <optional>
#include <string>
#include "chesscore/core/coord.h"
#include "chesscore/core/piece.h"

namespace chesscore {
namespace core {

/**
 * @brief The pure 8x8 board, no game information
 *
 * How it's stored:
 *
 *     . 0 1 2 3 4 5 6 7 .
 *     0 r n b q k b n r 0
 *     1 p p p p p p p p 1
 *     2 . . . . . . . . 2
 *     ...
 *     6 P P P P P P P P 6
 *     7 R N B Q K B N R 7
 *
 * Row 0 is rendered as rank 8. The board is a plain value: copying it is
 * how move simulation gets a scratch position.
 */
class Board {
public:
    using Cell = std::optional<Piece>;

    /**
     * @brief Create an empty board
     */
    Board() = default;

    /**
     * @brief Standard chess starting layout
     */
    static Board initial();

    /**
     * @brief Read a cell
     *
     * @param coord Square to read
     * @return The piece, or empty for an empty cell or an invalid coordinate
     */
    Cell at(const Coord& coord) const;

    /**
     * @brief Place a piece; ignored for invalid coordinates
     */
    void set(const Coord& coord, const Piece& piece);

    /**
     * @brief Empty a cell; ignored for invalid coordinates
     */
    void clear(const Coord& coord);

    /**
     * @brief Write an optional piece; ignored for invalid coordinates
     */
    void put(const Coord& coord, const Cell& cell);

    bool isEmpty(const Coord& coord) const { return !at(coord).has_value(); }

    std::optional<PieceType> pieceTypeAt(const Coord& coord) const;
    std::optional<PieceColor> pieceColorAt(const Coord& coord) const;

    static bool isValid(const Coord& coord) { return coord.isValid(); }

    /**
     * @brief Rotate the board 180 degrees in place
     */
    void flip();

    /**
     * @brief Rotated copy of the board
     */
    Board flipped() const;

    /**
     * @brief Locate the king of a color
     *
     * @return King square, or Coord::undefined() if there is none
     */
    Coord kingCoordinates(PieceColor color) const;

    int pieceCount() const;

    /**
     * @brief Multi-line text dump, rank 8 first
     */
    std::string toString() const;

    bool operator==(const Board& other) const { return cells_ == other.cells_; }
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    std::array<std::array<Cell, BOARD_SIZE>, BOARD_SIZE> cells_{};
};

} // namespace core
} // namespace chesscore

#endif // CHESSCORE_BOARD_H
