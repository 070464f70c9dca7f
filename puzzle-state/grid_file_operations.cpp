#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"
#include "grid_file_operations.hpp"

Grid read_grid_from_file(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    int side_length = 0;
    if (!(infile >> side_length)) {
        throw std::runtime_error("Missing side length in file: " + filename);
    }
    if (side_length < 1 || side_length > MAX_SIDE_LENGTH) {
        throw std::invalid_argument("Side length must be in [1," + std::to_string(MAX_SIDE_LENGTH)
                                    + "] in file: " + filename);
    }
    int n = side_length * side_length;
    std::vector<int> tiles(n);
    for (int i = 0; i < n; ++i) {
        if (!(infile >> tiles[i])) {
            throw std::runtime_error("Expected " + std::to_string(n) + " tiles in file: " + filename);
        }
    }
    return Grid(tiles, side_length);
}

void write_grid_to_file(const Grid& grid, const std::string& filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    int side_length = grid.get_side_length();
    outfile << side_length << "\n";
    for (int row = 0; row < side_length; ++row) {
        for (int col = 0; col < side_length; ++col) {
            if (col) outfile << " ";
            outfile << grid.tile_at(row, col);
        }
        outfile << "\n";
    }
    if (!outfile) {
        throw std::runtime_error("Failed writing file: " + filename);
    }
}
