#ifndef __SHUFFLE_GENERATOR_HPP___
#define __SHUFFLE_GENERATOR_HPP___

#include <random>

#include "grid.hpp"

/**
 * @file shuffle_generator.hpp
 * @brief Utilities to create random, solvable puzzle grids.
 *
 * Grids are produced by walking the blank randomly from the solved
 * arrangement, so every result is reachable by legal moves. The random
 * source is always passed in by the caller so runs can be reproduced.
 */

/**
 * @brief Random-walk steps performed per board cell by default.
 */
constexpr int SHUFFLE_MOVES_PER_CELL = 10;

/**
 * @brief Walk the blank randomly, starting from `start`.
 *
 * Each iteration shuffles the four axis directions and swaps the blank with
 * the first neighbour that lies on the board. An iteration with no
 * neighbour on the board leaves the grid unchanged.
 *
 * @param start Starting grid (normally the solved grid).
 * @param rng Random number generator to use (std::mt19937).
 * @param iterations Number of walk steps.
 * @return The shuffled grid.
 * @throws std::invalid_argument if `start` has no blank.
 */
Grid shuffle_random_walk(const Grid& start, std::mt19937 &rng, int iterations);

/**
 * @brief Random walk with the default length of SHUFFLE_MOVES_PER_CELL * n * n steps.
 */
Grid shuffle_random_walk(const Grid& start, std::mt19937 &rng);

/**
 * @brief Generate a solvable grid of the given side length.
 *
 * Shuffles the solved grid, then runs the solvability check and applies the
 * single-swap repair if (and only if) the check fails.
 *
 * @param side_length Board side length (1..MAX_SIDE_LENGTH).
 * @param rng Random number generator to use (std::mt19937).
 * @param repaired Optional out-parameter set to true when the repair ran.
 * @return A grid for which is_solvable() holds.
 */
Grid generate_solvable_grid(int side_length, std::mt19937 &rng, bool* repaired = nullptr);

#endif // __SHUFFLE_GENERATOR_HPP___
