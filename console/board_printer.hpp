#ifndef __BOARD_PRINTER_HPP___
#define __BOARD_PRINTER_HPP___

#include <ostream>

#include "grid.hpp"

/**
 * @file board_printer.hpp
 * @brief Text rendering of the board for the console front-end.
 */

/**
 * @brief Print the grid as a bordered table.
 *
 * Each cell is a 3-character right-aligned number followed by a space;
 * the blank cell is left empty.
 *
 *   Current Puzzle (3x3):
 *   +----+----+----+
 *   |  1 |  2 |  3 |
 *   +----+----+----+
 *   ...
 */
void print_board(const Grid& grid, std::ostream& out);

/**
 * @brief Print the one-line stats summary ("Moves: 4  Time: 00:12  Solvable: Yes").
 */
void print_stats(int move_count, double elapsed_seconds, bool solvable, std::ostream& out);

#endif // __BOARD_PRINTER_HPP___
