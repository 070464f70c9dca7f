#include <algorithm>
#include <array>
#include <cassert>
#include <random>
#include <stdexcept>

#include "grid.hpp"
#include "solvability.hpp"
#include "shuffle_generator.hpp"

using namespace std;

namespace {

// up, down, left, right
const array<Position, 4> DIRECTIONS = {{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};

}

Grid shuffle_random_walk(const Grid& start, mt19937 &rng, int iterations) {
    Grid shuffled = start;
    Position blank = shuffled.locate_blank();
    if (blank.row < 0) {
        throw invalid_argument("Cannot shuffle a grid without a blank");
    }
    array<Position, 4> directions = DIRECTIONS;
    for (int i = 0; i < iterations; ++i) {
        shuffle(directions.begin(), directions.end(), rng);
        for (const Position &dir : directions) {
            Position next{blank.row + dir.row, blank.col + dir.col};
            if (shuffled.in_bounds(next.row, next.col)) {
                shuffled.swap_tiles(blank, next);
                blank = next;
                break;
            }
        }
    }
    assert(shuffled.locate_blank() == blank);
    return shuffled;
}

Grid shuffle_random_walk(const Grid& start, mt19937 &rng) {
    int side_length = start.get_side_length();
    return shuffle_random_walk(start, rng, SHUFFLE_MOVES_PER_CELL * side_length * side_length);
}

Grid generate_solvable_grid(int side_length, mt19937 &rng, bool* repaired) {
    Grid grid = shuffle_random_walk(solved_grid(side_length), rng);
    bool did_repair = false;
    if (!is_solvable(grid)) {
        did_repair = repair_solvability(grid);
    }
    if (repaired) {
        *repaired = did_repair;
    }
    assert(grid.is_permutation());
    return grid;
}
