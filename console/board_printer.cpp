#include <iomanip>
#include <ostream>
#include <string>

#include "board_printer.hpp"
#include "session_clock.hpp"

using namespace std;

static void print_border(int side_length, ostream& out) {
    out << '+';
    for (int col = 0; col < side_length; ++col) out << "----+";
    out << '\n';
}

void print_board(const Grid& grid, ostream& out) {
    int side_length = grid.get_side_length();
    out << "Current Puzzle (" << side_length << "x" << side_length << "):\n";
    print_border(side_length, out);
    for (int row = 0; row < side_length; ++row) {
        out << '|';
        for (int col = 0; col < side_length; ++col) {
            int v = grid.tile_at(row, col);
            if (v == 0) {
                out << "    |";
            } else {
                out << setw(3) << v << " |";
            }
        }
        out << '\n';
        print_border(side_length, out);
    }
}

void print_stats(int move_count, double elapsed_seconds, bool solvable, ostream& out) {
    out << "Moves: " << move_count
        << "  Time: " << format_elapsed_short(elapsed_seconds)
        << "  Solvable: " << (solvable ? "Yes" : "No") << '\n';
}
