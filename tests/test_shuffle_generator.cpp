// Google Test for the random-walk shuffle and solvable grid generation
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <vector>

#include "grid.hpp"
#include "shuffle_generator.hpp"
#include "solvability.hpp"
#include "win_detector.hpp"

TEST(ShuffleGenerator, ZeroIterationsKeepsGrid) {
    std::mt19937 rng(1);
    Grid solved = solved_grid(4);
    EXPECT_EQ(shuffle_random_walk(solved, rng, 0), solved);
}

TEST(ShuffleGenerator, SingleStepMovesBlankToNeighbour) {
    std::mt19937 rng(7);
    Grid shuffled = shuffle_random_walk(solved_grid(3), rng, 1);
    Position blank = shuffled.locate_blank();
    EXPECT_TRUE(is_adjacent(blank, Position{2, 2}));
    EXPECT_TRUE(shuffled.is_permutation());
}

TEST(ShuffleGenerator, RandomWalkStaysSolvable) {
    for (int n = 2; n <= 6; ++n) {
        for (unsigned int seed = 0; seed < 20; ++seed) {
            std::mt19937 rng(seed);
            Grid shuffled = shuffle_random_walk(solved_grid(n), rng);
            EXPECT_TRUE(shuffled.is_permutation());
            EXPECT_TRUE(is_solvable(shuffled)) << "n=" << n << " seed=" << seed;
        }
    }
}

TEST(ShuffleGenerator, SameSeedSameGrid) {
    std::mt19937 a(42);
    std::mt19937 b(42);
    EXPECT_EQ(generate_solvable_grid(5, a), generate_solvable_grid(5, b));
}

TEST(ShuffleGenerator, GeneratedGridNeedsNoRepair) {
    for (int n = 2; n <= 6; ++n) {
        for (unsigned int seed = 0; seed < 10; ++seed) {
            std::mt19937 rng(seed);
            bool repaired = true;
            Grid g = generate_solvable_grid(n, rng, &repaired);
            EXPECT_FALSE(repaired);
            EXPECT_TRUE(is_solvable(g));
            EXPECT_EQ(g.get_side_length(), n);
        }
    }
}

TEST(ShuffleGenerator, LargeBoardsAreShuffled) {
    std::mt19937 rng(3);
    Grid g = generate_solvable_grid(6, rng);
    EXPECT_FALSE(is_solved(g));
}

TEST(ShuffleGenerator, GridWithoutBlankThrows) {
    std::mt19937 rng(0);
    Grid g = solved_grid(2);
    g.set_tile(1, 1, 4);
    EXPECT_THROW(shuffle_random_walk(g, rng, 5), std::invalid_argument);
}
