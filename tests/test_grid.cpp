// Google Test for Grid (creation, accessors and adjacency)
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "grid.hpp"

TEST(GridTest, SolvedGridLayout) {
    Grid g = solved_grid(3);
    std::vector<int> expected = {1, 2, 3, 4, 5, 6, 7, 8, 0};
    EXPECT_EQ(g.get_tiles(), expected);
    EXPECT_EQ(g.get_side_length(), 3);

    // (r, c) holds r*n + c + 1
    Grid g4 = solved_grid(4);
    EXPECT_EQ(g4.tile_at(0, 0), 1);
    EXPECT_EQ(g4.tile_at(1, 2), 7);
    EXPECT_EQ(g4.tile_at(3, 2), 15);
    EXPECT_EQ(g4.tile_at(3, 3), 0);
}

TEST(GridTest, SolvedGridRejectsNonPositiveSide) {
    EXPECT_THROW(solved_grid(0), std::invalid_argument);
    EXPECT_THROW(solved_grid(-2), std::invalid_argument);
}

TEST(GridTest, SideLengthIsCapped) {
    EXPECT_EQ(solved_grid(MAX_SIDE_LENGTH).get_side_length(), MAX_SIDE_LENGTH);
    EXPECT_THROW(solved_grid(MAX_SIDE_LENGTH + 1), std::invalid_argument);
    EXPECT_THROW(solved_grid(50000), std::invalid_argument);
    EXPECT_THROW(Grid(std::vector<int>{1, 2, 3, 0}, 50000), std::invalid_argument);
}

TEST(GridTest, ValidCreationInfersSide) {
    Grid g(std::vector<int>{1, 2, 3, 0});
    EXPECT_EQ(g.get_side_length(), 2);
    EXPECT_EQ(g.tile_at(1, 1), 0);
}

TEST(GridTest, DuplicateTilesThrows) {
    std::vector<int> tiles = {1, 2, 3, 4, 5, 6, 7, 7, 0};
    EXPECT_THROW(Grid(tiles, 3), std::invalid_argument);
}

TEST(GridTest, OutOfRangeTileValueThrows) {
    std::vector<int> tiles = {1, 2, 3, 4, 100, 6, 7, 8, 0};
    EXPECT_THROW(Grid(tiles, 3), std::invalid_argument);
}

TEST(GridTest, WrongTileCountThrows) {
    EXPECT_THROW(Grid(std::vector<int>{1, 2, 0}, 2), std::invalid_argument);
    EXPECT_THROW(Grid(std::vector<int>{1, 2, 0}), std::invalid_argument);
}

TEST(GridTest, OutOfBoundsAccessThrows) {
    Grid g = solved_grid(3);
    EXPECT_THROW(g.tile_at(3, 0), std::out_of_range);
    EXPECT_THROW(g.tile_at(0, -1), std::out_of_range);
    EXPECT_THROW(g.set_tile(-1, 0, 5), std::out_of_range);
    EXPECT_THROW(g.swap_tiles(Position{0, 0}, Position{0, 3}), std::out_of_range);
}

TEST(GridTest, SetTileAndSwap) {
    Grid g = solved_grid(3);
    g.swap_tiles(Position{2, 2}, Position{2, 1});
    EXPECT_EQ(g.tile_at(2, 1), 0);
    EXPECT_EQ(g.tile_at(2, 2), 8);
    EXPECT_TRUE(g.is_permutation());

    g.set_tile(0, 0, 2);
    EXPECT_FALSE(g.is_permutation());
    g.set_tile(0, 0, 1);
    EXPECT_TRUE(g.is_permutation());
}

TEST(GridTest, LocateBlank) {
    Grid g(std::vector<int>{1, 2, 3, 4, 0, 5, 6, 7, 8}, 3);
    EXPECT_EQ(g.locate_blank(), (Position{1, 1}));
    EXPECT_EQ(solved_grid(4).locate_blank(), (Position{3, 3}));
}

TEST(GridTest, Adjacency) {
    EXPECT_TRUE(is_adjacent(Position{1, 1}, Position{0, 1}));
    EXPECT_TRUE(is_adjacent(Position{1, 1}, Position{1, 2}));
    EXPECT_FALSE(is_adjacent(Position{1, 1}, Position{1, 1}));
    EXPECT_FALSE(is_adjacent(Position{1, 1}, Position{2, 2}));
    EXPECT_FALSE(is_adjacent(Position{0, 0}, Position{0, 2}));
}

TEST(GridTest, Equality) {
    Grid a = solved_grid(3);
    Grid b = solved_grid(3);
    EXPECT_TRUE(a == b);
    b.swap_tiles(Position{0, 0}, Position{0, 1});
    EXPECT_TRUE(a != b);
    EXPECT_FALSE(solved_grid(2) == solved_grid(3));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
