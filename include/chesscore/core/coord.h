// include/chesscore/core/coord.h
#ifndef CHESSCORE_COORD_H
#define CHESSCORE_COORD_H

#include <optional>
#include <string>

namespace chesscore {
namespace core {

constexpr int BOARD_SIZE = 8;
constexpr int UNDEFINED_POSITION = -1;

/**
 * @brief A (row, col) square on the board
 *
 * Row 0 is rank 8 and col 0 is file a, so White starts on rows 6-7.
 * The undefined coordinate stands for "no selection" and must never be
 * used to read the board.
 */
struct Coord {
    int row = UNDEFINED_POSITION;  // rank, y axis
    int col = UNDEFINED_POSITION;  // file, x axis

    Coord() = default;
    Coord(int r, int c) : row(r), col(c) {}

    /**
     * @brief Build a coordinate only if it is on the board
     *
     * @param row Row index
     * @param col Column index
     * @return Coordinate, or empty if out of range
     */
    static std::optional<Coord> make(int row, int col);

    /**
     * @brief Sentinel for "no square selected"
     */
    static Coord undefined() { return Coord(); }

    bool isValid() const {
        return row >= 0 && row < BOARD_SIZE && col >= 0 && col < BOARD_SIZE;
    }

    /**
     * @brief Same square seen from the other side of the board
     */
    Coord flipped() const;

    /**
     * @brief Algebraic name of the square ("e2"), empty if invalid
     */
    std::string toAlgebraic() const;

    /**
     * @brief Parse an algebraic square name
     *
     * @param text Two characters, file a-h followed by rank 1-8
     * @return Coordinate, or empty if the text is not a square
     */
    static std::optional<Coord> fromAlgebraic(const std::string& text);

    bool operator==(const Coord& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Coord& other) const { return !(*this == other); }
    bool operator<(const Coord& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }
};

} // namespace core
} // namespace chesscore

#endif // CHESSCORE_COORD_H
