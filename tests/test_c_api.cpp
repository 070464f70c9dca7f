// Google Test for the C wrapper used by FFI front-ends
#include <gtest/gtest.h>
#include <limits>
#include <cstdio>
#include <string>
#include <vector>

#include "grid.hpp"
#include "grid_file_operations.hpp"
#include "solvability.hpp"
#include "puzzle_c_api.h"

static std::vector<int> tiles_of(const PuzzleSession* s) {
    int n = puzzle_session_side(s);
    std::vector<int> tiles;
    for (int row = 0; row < n; ++row)
        for (int col = 0; col < n; ++col)
            tiles.push_back(puzzle_session_tile_at(s, row, col));
    return tiles;
}

TEST(CApi, CreateAndInspect) {
    PuzzleSession* s = puzzle_session_create(4, 123);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(puzzle_session_side(s), 4);
    EXPECT_EQ(puzzle_session_move_count(s), 0);
    EXPECT_EQ(puzzle_session_state(s), PUZZLE_STATE_PLAYING);

    Grid g(tiles_of(s), 4);
    EXPECT_TRUE(is_solvable(g));
    int br = puzzle_session_blank_row(s);
    int bc = puzzle_session_blank_col(s);
    EXPECT_EQ(puzzle_session_tile_at(s, br, bc), 0);
    EXPECT_EQ(puzzle_session_tile_at(s, 4, 0), PUZZLE_ERR_ARGUMENT);
    puzzle_session_destroy(s);
}

TEST(CApi, RejectsBadArguments) {
    EXPECT_EQ(puzzle_session_create(1, 0), nullptr);
    EXPECT_EQ(puzzle_session_create(MAX_SIDE_LENGTH + 1, 0), nullptr);
    EXPECT_EQ(puzzle_session_create(50000, 0), nullptr);
    EXPECT_EQ(puzzle_session_side(nullptr), PUZZLE_ERR_ARGUMENT);
    EXPECT_EQ(puzzle_session_move(nullptr, 0, 0), PUZZLE_ERR_ARGUMENT);
    EXPECT_EQ(puzzle_session_state(nullptr), PUZZLE_ERR_ARGUMENT);
    EXPECT_LT(puzzle_session_elapsed(nullptr), 0.0);
    puzzle_session_destroy(nullptr);
}

TEST(CApi, MovePauseAndClock) {
    PuzzleSession* s = puzzle_session_create(3, 8);
    ASSERT_NE(s, nullptr);
    int br = puzzle_session_blank_row(s);
    int bc = puzzle_session_blank_col(s);
    int row = br > 0 ? br - 1 : br + 1;

    EXPECT_EQ(puzzle_session_can_move(s, br, bc), 0);
    EXPECT_EQ(puzzle_session_move(s, br, bc), 0);
    EXPECT_EQ(puzzle_session_tick(s, 2.0), 1);

    EXPECT_EQ(puzzle_session_pause(s), 1);
    EXPECT_EQ(puzzle_session_state(s), PUZZLE_STATE_PAUSED);
    EXPECT_EQ(puzzle_session_move(s, row, bc), 0);
    EXPECT_EQ(puzzle_session_tick(s, 5.0), 0);
    EXPECT_EQ(puzzle_session_resume(s), 1);

    EXPECT_EQ(puzzle_session_move(s, row, bc), 1);
    EXPECT_EQ(puzzle_session_move_count(s), 1);
    EXPECT_DOUBLE_EQ(puzzle_session_elapsed(s), 2.0);

    EXPECT_EQ(puzzle_session_restart(s), 0);
    EXPECT_EQ(puzzle_session_move_count(s), 0);
    EXPECT_DOUBLE_EQ(puzzle_session_elapsed(s), 0.0);

    EXPECT_EQ(puzzle_session_change_size(s, 5), 0);
    EXPECT_EQ(puzzle_session_side(s), 5);
    EXPECT_EQ(puzzle_session_change_size(s, 1), PUZZLE_ERR_ARGUMENT);
    EXPECT_EQ(puzzle_session_change_size(s, 50000), PUZZLE_ERR_ARGUMENT);
    EXPECT_EQ(puzzle_session_side(s), 5);

    EXPECT_EQ(puzzle_session_tick(s, std::numeric_limits<double>::quiet_NaN()), 0);
    EXPECT_EQ(puzzle_session_tick(s, std::numeric_limits<double>::infinity()), 0);
    EXPECT_DOUBLE_EQ(puzzle_session_elapsed(s), 0.0);
    puzzle_session_destroy(s);
}

TEST(CApi, GenerateToFile) {
    char path[1024];
    std::string dir = ::testing::TempDir() + "puzzle_c_api";
    ASSERT_EQ(puzzle_generate_to_file(4, 77, dir.c_str(), path, sizeof(path)), 0);
    Grid g = read_grid_from_file(path);
    EXPECT_EQ(g.get_side_length(), 4);
    EXPECT_TRUE(is_solvable(g));
    std::remove(path);

    char tiny[4];
    EXPECT_EQ(puzzle_generate_to_file(4, 77, dir.c_str(), tiny, sizeof(tiny)), PUZZLE_ERR_BUFFER);
    EXPECT_EQ(puzzle_generate_to_file(1, 77, dir.c_str(), path, sizeof(path)), PUZZLE_ERR_ARGUMENT);
    EXPECT_EQ(puzzle_generate_to_file(4, 77, nullptr, path, sizeof(path)), PUZZLE_ERR_ARGUMENT);
}
