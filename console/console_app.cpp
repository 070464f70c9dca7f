#include <chrono>
#include <fstream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

#include "console_app.hpp"
#include "console_loop.hpp"
#include "difficulty.hpp"
#include "game_session.hpp"
#include "grid_file_operations.hpp"
#include "session_clock.hpp"

using namespace std;

static void print_usage(ostream &out) {
    out << "Usage: sliding-puzzle [--side N] [--seed S] [--input-file F] [--script F]\n"
        << "  --side N         board side length (default " << DEFAULT_SIDE_LENGTH << ")\n"
        << "  --seed S         seed for the shuffle (default: time based)\n"
        << "  --input-file F   play the puzzle stored in F instead of a generated one\n"
        << "  --script F       read moves from F instead of standard input\n";
}

static GameSession make_session(const string &input_file, int side_size, mt19937 &rng) {
    if (!input_file.empty()) {
        return GameSession(read_grid_from_file(input_file));
    }
    return new_session(side_size, rng);
}

unsigned int parse_seed(const string &text) {
    if (!text.empty() && text[0] == '-') {
        throw out_of_range("seed must not be negative: " + text);
    }
    unsigned long value = stoul(text);
    if (value > numeric_limits<unsigned int>::max()) {
        throw out_of_range("seed does not fit in 32 bits: " + text);
    }
    return static_cast<unsigned int>(value);
}

int run_console_app(int argc, char** argv, istream &in, ostream &out, ostream &err) {
    int side_size = DEFAULT_SIDE_LENGTH;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();
    string input_file;
    string script_file;

    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--side" && i + 1 < argc) { side_size = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = parse_seed(argv[++i]); }
            else if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
            else if (a == "--script" && i + 1 < argc) { script_file = argv[++i]; }
            else if (a == "--help") {
                print_usage(out);
                return 0;
            }
            else {
                err << "Unknown argument: " << a << '\n';
                print_usage(err);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        err << "Invalid numeric argument: " << e.what() << '\n';
        return 1;
    }

    ifstream script;
    if (!script_file.empty()) {
        script.open(script_file);
        if (!script.is_open()) {
            err << "Could not open script: " << script_file << '\n';
            return 3;
        }
    }
    istream &moves = script_file.empty() ? in : script;

    mt19937 rng(seed);

    try {
        GameSession session = make_session(input_file, side_size, rng);
        SessionClock clock;

        out << "Sliding Puzzle - " << difficulty_label(session.get_side_length()) << '\n';
        out << "Type 'help' for commands.\n";

        run_console_loop(session, clock, rng, moves, out);
        return 0;
    } catch (const std::exception& e) {
        err << "Error creating puzzle: " << e.what() << '\n';
        return 2;
    }
}
