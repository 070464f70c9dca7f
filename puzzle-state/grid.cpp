#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"

using namespace std;

bool is_adjacent(const Position &a, const Position &b) {
    return abs(a.row - b.row) + abs(a.col - b.col) == 1;
}

static void check_side_length(int side_length) {
    if (side_length < 1) {
        throw invalid_argument("Side length must be positive");
    }
    if (side_length > MAX_SIDE_LENGTH) {
        throw invalid_argument("Side length " + to_string(side_length) + " exceeds the maximum of "
                               + to_string(MAX_SIDE_LENGTH));
    }
}

void Grid::init(const vector<int>& tiles, int side_length) {
    check_side_length(side_length);
    int num_cells = side_length * side_length;
    if (static_cast<int>(tiles.size()) != num_cells) {
        throw invalid_argument("Expected " + to_string(num_cells) + " tiles, got " + to_string(tiles.size()));
    }
    vector<bool> seen(num_cells, false);
    for (int v : tiles) {
        if (v < 0 || v >= num_cells) {
            throw invalid_argument("Tile values must be in range [0," + to_string(num_cells - 1) + "]");
        }
        if (seen[v]) {
            throw invalid_argument("Duplicate tile value " + to_string(v));
        }
        seen[v] = true;
    }
    this->side_length = side_length;
    this->tiles = tiles;
}

Grid::Grid(const vector<int>& tiles) {
    if (tiles.size() > static_cast<size_t>(MAX_SIDE_LENGTH) * MAX_SIDE_LENGTH) {
        throw invalid_argument("Too many tiles for a " + to_string(MAX_SIDE_LENGTH) + "x"
                               + to_string(MAX_SIDE_LENGTH) + " grid");
    }
    int side = static_cast<int>(lround(sqrt(static_cast<double>(tiles.size()))));
    if (side * side != static_cast<int>(tiles.size())) {
        throw invalid_argument("Tile count is not a perfect square");
    }
    init(tiles, side);
}

Grid::Grid(const vector<int>& tiles, int side_length) {
    init(tiles, side_length);
}

size_t Grid::index_of(int row, int col) const {
    if (!in_bounds(row, col)) {
        throw out_of_range("Cell (" + to_string(row) + ", " + to_string(col) + ") is outside a "
                           + to_string(side_length) + "x" + to_string(side_length) + " grid");
    }
    return static_cast<size_t>(row * side_length + col);
}

int Grid::get_side_length() const {
    return side_length;
}

const vector<int>& Grid::get_tiles() const {
    return tiles;
}

bool Grid::in_bounds(int row, int col) const {
    return row >= 0 && row < side_length && col >= 0 && col < side_length;
}

int Grid::tile_at(int row, int col) const {
    return tiles[index_of(row, col)];
}

void Grid::set_tile(int row, int col, int value) {
    tiles[index_of(row, col)] = value;
}

void Grid::swap_tiles(const Position &a, const Position &b) {
    size_t ia = index_of(a.row, a.col);
    size_t ib = index_of(b.row, b.col);
    int tmp = tiles[ia];
    tiles[ia] = tiles[ib];
    tiles[ib] = tmp;
}

Position Grid::locate_blank() const {
    for (size_t i = 0; i < tiles.size(); ++i) {
        if (tiles[i] == 0) {
            return Position{static_cast<int>(i) / side_length, static_cast<int>(i) % side_length};
        }
    }
    return Position{-1, -1};
}

bool Grid::is_permutation() const {
    vector<bool> seen(tiles.size(), false);
    for (int v : tiles) {
        if (v < 0 || v >= static_cast<int>(tiles.size()) || seen[v]) return false;
        seen[v] = true;
    }
    return true;
}

bool Grid::operator==(const Grid &rhs) const {
    return side_length == rhs.side_length && tiles == rhs.tiles;
}

bool Grid::operator!=(const Grid &rhs) const {
    return !(*this == rhs);
}

Grid solved_grid(int side_length) {
    check_side_length(side_length);
    int num_cells = side_length * side_length;
    vector<int> tiles(num_cells);
    for (int i = 0; i < num_cells - 1; ++i) tiles[i] = i + 1;
    tiles[num_cells - 1] = 0;
    return Grid(tiles, side_length);
}
