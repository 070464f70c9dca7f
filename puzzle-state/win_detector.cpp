#include <vector>

#include "grid.hpp"
#include "win_detector.hpp"

using namespace std;

bool is_solved(const Grid& grid) {
    const vector<int>& tiles = grid.get_tiles();
    if (tiles.empty()) return false;
    size_t last = tiles.size() - 1;
    for (size_t i = 0; i < last; ++i) {
        if (tiles[i] != static_cast<int>(i) + 1) return false;
    }
    return tiles[last] == 0;
}
