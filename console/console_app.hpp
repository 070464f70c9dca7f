#ifndef __CONSOLE_APP_HPP___
#define __CONSOLE_APP_HPP___

#include <iostream>
#include <string>

/**
 * @file console_app.hpp
 * @brief Command-line entry point of the text console.
 */

/**
 * @brief Parse a --seed value.
 *
 * @throws std::invalid_argument if the text is not a number.
 * @throws std::out_of_range if the value does not fit in an unsigned int.
 */
unsigned int parse_seed(const std::string &text);

/**
 * @brief Parse the arguments, set up a session and play it.
 *
 * Moves are read from `in` unless --script names a file.
 * @return 0 on a normal exit, 1 on bad arguments, 2 if the puzzle could not
 *         be created or loaded, 3 if the script could not be opened.
 */
int run_console_app(int argc, char** argv, std::istream &in, std::ostream &out, std::ostream &err);

#endif // __CONSOLE_APP_HPP___
