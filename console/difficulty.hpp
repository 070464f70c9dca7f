#ifndef __DIFFICULTY_HPP___
#define __DIFFICULTY_HPP___

#include <string>

/**
 * @file difficulty.hpp
 * @brief Display labels for board sizes. The engine only deals in sizes.
 */

constexpr int DEFAULT_SIDE_LENGTH = 3;

/**
 * @brief "Easy (3x3)" .. "Expert (6x6)" for the named sizes, "Custom (NxN)" otherwise.
 */
std::string difficulty_label(int side_length);

/**
 * @brief Next named size in the cycle 3 -> 4 -> 5 -> 6 -> 3. Unnamed sizes go to 3.
 */
int next_difficulty_size(int side_length);

#endif // __DIFFICULTY_HPP___
