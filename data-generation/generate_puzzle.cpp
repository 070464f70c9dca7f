#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "grid_file_operations.hpp"
#include "shuffle_generator.hpp"
#include "solvability.hpp"

using namespace std;

int main(int argc, char** argv) {
    int side_size = 3;
    unsigned int seed = 0;
    string output_file;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--side" && i + 1 < argc) { side_size = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) {
                unsigned long value = stoul(argv[++i]);
                if (value > numeric_limits<unsigned int>::max()) {
                    throw out_of_range("seed does not fit in 32 bits");
                }
                seed = static_cast<unsigned int>(value);
            }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: generate-puzzle --output-file F [--side N] [--seed S]\n";
                return 0;
            }
        }
    } catch (const std::logic_error& e) {
        cerr << "Invalid numeric argument: " << e.what() << '\n';
        return 1;
    }
    if (output_file.empty()) {
        cerr << "--output-file is required\n";
        return 1;
    }
    if (side_size < 2 || side_size > MAX_SIDE_LENGTH) {
        cerr << "side must be between 2 and " << MAX_SIDE_LENGTH << "\n";
        return 3;
    }

    mt19937 rng(seed);
    bool repaired = false;
    try {
        Grid sample = generate_solvable_grid(side_size, rng, &repaired);
        write_grid_to_file(sample, output_file);
        cout << side_size << "x" << side_size << ", seed: " << seed
             << ", inversions: " << count_inversions(sample)
             << ", repaired: " << (repaired ? 1 : 0) << ", file: " << output_file << '\n';
    } catch (const std::exception& e) {
        cerr << "Error generating puzzle: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
