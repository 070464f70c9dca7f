#include <vector>

#include "grid.hpp"
#include "solvability.hpp"

using namespace std;

int count_inversions(const Grid& grid) {
    vector<int> flat;
    flat.reserve(grid.get_tiles().size());
    for (int v : grid.get_tiles()) {
        if (v != 0) flat.push_back(v);
    }
    int inversions = 0;
    for (size_t i = 0; i < flat.size(); ++i) {
        for (size_t j = i + 1; j < flat.size(); ++j) {
            if (flat[i] > flat[j]) ++inversions;
        }
    }
    return inversions;
}

bool is_solvable(const Grid& grid) {
    int inversions = count_inversions(grid);
    int side_length = grid.get_side_length();
    if (side_length % 2 == 1) {
        return inversions % 2 == 0;
    }
    int blank_row_from_bottom = side_length - grid.locate_blank().row;
    return (inversions + blank_row_from_bottom) % 2 == 1;
}

bool repair_solvability(Grid& grid) {
    int side_length = grid.get_side_length();
    vector<Position> non_blank;
    for (int row = 0; row < side_length && non_blank.size() < 2; ++row) {
        for (int col = 0; col < side_length && non_blank.size() < 2; ++col) {
            if (grid.tile_at(row, col) != 0) non_blank.push_back(Position{row, col});
        }
    }
    if (non_blank.size() < 2) return false;
    grid.swap_tiles(non_blank[0], non_blank[1]);
    return true;
}
