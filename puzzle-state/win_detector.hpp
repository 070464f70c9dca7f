#ifndef __WIN_DETECTOR_HPP___
#define __WIN_DETECTOR_HPP___

#include "grid.hpp"

/**
 * @file win_detector.hpp
 * @brief Solved-state test for N-puzzle grids.
 */

/**
 * @brief True iff every cell but the last holds its 1-based sequence number
 * and the last cell holds the blank. Stops at the first mismatch.
 */
bool is_solved(const Grid& grid);

#endif // __WIN_DETECTOR_HPP___
