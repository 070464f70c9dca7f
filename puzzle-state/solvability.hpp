#ifndef __SOLVABILITY_HPP___
#define __SOLVABILITY_HPP___

#include "grid.hpp"

/**
 * @file solvability.hpp
 * @brief Reachability test for N-puzzle arrangements (inversion parity).
 */

/**
 * @brief Count inversions of the row-major tile sequence with the blank removed.
 *
 * An inversion is a pair i < j where the tile at i has a greater number than
 * the tile at j.
 */
int count_inversions(const Grid& grid);

/**
 * @brief Whether the arrangement can be reached from the solved grid by legal moves.
 *
 * Odd side: inversion count must be even.
 * Even side: with the blank's row counted from the bottom (bottom row = 1),
 * inversions + row must be odd.
 */
bool is_solvable(const Grid& grid);

/**
 * @brief Swap the first two non-blank cells in row-major order.
 *
 * A single transposition flips the inversion parity, and therefore the
 * solvability classification. Apply at most once per generated grid.
 *
 * @return false (grid untouched) if fewer than two non-blank tiles exist.
 */
bool repair_solvability(Grid& grid);

#endif // __SOLVABILITY_HPP___
