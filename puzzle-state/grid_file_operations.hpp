#ifndef __GRID_FILE_OPERATIONS_HPP___
#define __GRID_FILE_OPERATIONS_HPP___

#include <string>

#include "grid.hpp"

/**
 * @file grid_file_operations.hpp
 * @brief Simple helpers to read/write `Grid` values from plain text files.
 *
 * The file format is a minimal plain-text format: the first token is
 * `side_length`, followed by side_length * side_length tile values in
 * row-major order (0 marks the blank). Whitespace layout is free.
 */

/**
 * @brief Read a `Grid` from a simple plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened or ends early.
 * @throws std::invalid_argument if the values are not a valid arrangement.
 * @return Constructed `Grid` instance.
 */
Grid read_grid_from_file(const std::string& filename);

/**
 * @brief Write a `Grid` to a simple plain-text file, one board row per line.
 *
 * @param grid Grid to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_grid_to_file(const Grid& grid, const std::string& filename);

#endif // __GRID_FILE_OPERATIONS_HPP___
