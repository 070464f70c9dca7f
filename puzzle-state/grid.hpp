/**
 * @file grid.hpp
 * @brief N-puzzle grid representation (tile arrangement and coordinate helpers).
 *
 * This header declares the Grid class shared by the generator, the session
 * and every front-end.
 */

#ifndef __GRID_HPP___
#define __GRID_HPP___

#include <cstddef>
#include <vector>

using namespace std;

/**
 * @brief Largest supported board side. Keeps cell counts and shuffle lengths within int.
 */
constexpr int MAX_SIDE_LENGTH = 100;

/**
 * @brief A 0-based (row, col) cell coordinate.
 */
struct Position {
    int row;
    int col;

    bool operator==(const Position &rhs) const { return row == rhs.row && col == rhs.col; }
    bool operator!=(const Position &rhs) const { return !(*this == rhs); }
};

/**
 * @brief True iff the Manhattan distance between the two cells equals 1.
 */
bool is_adjacent(const Position &a, const Position &b);

/**
 * @brief Square sliding-puzzle board.
 *
 * Tiles are stored row-major. Value 0 is the blank; every other value is the
 * tile's 1-based position in the solved arrangement. A Grid built from
 * external data is checked to be a permutation of 0..side*side-1.
 */
class Grid {

private:
    vector<int> tiles;
    int side_length = 0;
    void init(const vector<int>& tiles, int side_length);
    size_t index_of(int row, int col) const;
public:
    Grid() = default;

    /**
     * @brief Construct a Grid with the side length inferred from the tile count.
     *
     * @param tiles Tile values in row-major order (length must be a perfect square).
     * @throws std::invalid_argument if the tiles are not a permutation of 0..n*n-1.
     */
    explicit Grid(const vector<int>& tiles);

    /**
     * @brief Construct a Grid with explicit side length.
     *
     * @param tiles Tile values in row-major order (length = side_length * side_length).
     * @param side_length Board side length.
     * @throws std::invalid_argument on inconsistent input.
     */
    Grid(const vector<int>& tiles, int side_length);
    ~Grid() = default;

    Grid(const Grid& other) = default;
    Grid& operator=(const Grid& other) = default;
    Grid(Grid&& other) = default;
    Grid& operator=(Grid&& other) = default;

    int get_side_length() const;

    /**
     * @brief Row-major view of all cells, blank included.
     */
    const vector<int>& get_tiles() const;

    bool in_bounds(int row, int col) const;

    /**
     * @brief Value stored at (row, col).
     * @throws std::out_of_range if the cell is outside the board.
     */
    int tile_at(int row, int col) const;

    /**
     * @brief Overwrite the value at (row, col).
     *
     * The permutation invariant is not re-checked; the caller is responsible
     * for restoring it before handing the grid on.
     * @throws std::out_of_range if the cell is outside the board.
     */
    void set_tile(int row, int col, int value);

    /**
     * @brief Exchange the values of two cells.
     * @throws std::out_of_range if either cell is outside the board.
     */
    void swap_tiles(const Position &a, const Position &b);

    /**
     * @brief Scan for the cell holding the blank.
     *
     * Only meant for construction and consistency checks; steady-state code
     * tracks the blank incrementally.
     * @return Position of the blank, or {-1, -1} if the grid has none.
     */
    Position locate_blank() const;

    /**
     * @brief Re-check that the cells hold each value of 0..n*n-1 exactly once.
     */
    bool is_permutation() const;

    bool operator==(const Grid &rhs) const;
    bool operator!=(const Grid &rhs) const;
};

/**
 * @brief Canonical solved arrangement: (r, c) holds r*n + c + 1, last cell blank.
 *
 * @param side_length Board side length (1..MAX_SIDE_LENGTH).
 * @throws std::invalid_argument if side_length is outside 1..MAX_SIDE_LENGTH.
 */
Grid solved_grid(int side_length);

#endif // __GRID_HPP___
