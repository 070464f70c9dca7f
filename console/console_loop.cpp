#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "board_printer.hpp"
#include "console_loop.hpp"
#include "difficulty.hpp"

using namespace std;

static const char* PROMPT = "Enter your move (row, col) or 0 to quit: ";

static string to_lower(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return s;
}

static vector<string> split_words(const string &line) {
    vector<string> words;
    istringstream iss(line);
    string w;
    while (iss >> w) words.push_back(w);
    return words;
}

static bool parse_int(const string &token, int &value) {
    istringstream iss(token);
    char extra;
    if (!(iss >> value)) return false;
    return !(iss >> extra);
}

InputKind parse_move_line(const string &line, int &row, int &col) {
    string cleaned = line;
    for (char &c : cleaned) {
        if (c == ',' || c == '(' || c == ')' || c == '[' || c == ']') c = ' ';
    }
    vector<string> tokens = split_words(cleaned);
    if (tokens.empty()) return InputKind::Quit;

    vector<int> values;
    for (const string &tok : tokens) {
        int v = 0;
        if (!parse_int(tok, v)) return InputKind::Invalid;
        values.push_back(v);
    }
    bool all_zero = all_of(values.begin(), values.end(), [](int v) { return v == 0; });
    if (all_zero) return InputKind::Quit;
    if (values.size() != 2) return InputKind::Invalid;
    row = values[0];
    col = values[1];
    return InputKind::Move;
}

static void print_help(ostream &out) {
    out << "Commands:\n"
        << "  row, col   slide the tile at (row, col) into the blank (1-indexed)\n"
        << "  restart    new puzzle at the current size\n"
        << "  size [N]   switch to the next difficulty, or to an N x N board\n"
        << "  pause      pause the game clock\n"
        << "  resume     resume after a pause\n"
        << "  0          quit\n";
}

static void print_position(const GameSession &session, const SessionClock &clock, ostream &out) {
    out << '\n';
    print_board(session.get_grid(), out);
    print_stats(session.get_move_count(), clock.get_elapsed_seconds(), session.is_solvable(), out);
}

static void print_win(const GameSession &session, const SessionClock &clock, ostream &out) {
    out << "\nCongratulations!\n"
        << "You solved the " << difficulty_label(session.get_side_length()) << " puzzle!\n"
        << "Moves: " << session.get_move_count() << '\n'
        << "Time: " << format_elapsed_short(clock.get_elapsed_seconds()) << '\n';
}

static void start_over(GameSession &session, SessionClock &clock, GameSession next, ostream &out) {
    session = next;
    clock.reset();
    out << "Starting a new " << difficulty_label(session.get_side_length()) << " puzzle.\n";
    print_position(session, clock, out);
}

// Returns true if the line was a command and has been handled.
static bool handle_command(const vector<string> &words, GameSession &session, SessionClock &clock,
                           mt19937 &rng, ostream &out) {
    string cmd = to_lower(words[0]);
    if (cmd == "help") {
        print_help(out);
    } else if (cmd == "restart" && words.size() == 1) {
        start_over(session, clock, restart(session, rng), out);
    } else if (cmd == "size" && words.size() <= 2) {
        int side_length = next_difficulty_size(session.get_side_length());
        if (words.size() == 2 && !parse_int(words[1], side_length)) {
            out << "Invalid size: " << words[1] << '\n';
            return true;
        }
        try {
            start_over(session, clock, change_size(session, side_length, rng), out);
        } catch (const invalid_argument &e) {
            out << "Invalid size: " << e.what() << '\n';
        }
    } else if (cmd == "pause" && words.size() == 1) {
        if (session.pause()) {
            out << "Game paused. Type 'resume' to continue.\n";
        } else {
            out << "The game is not running.\n";
        }
    } else if (cmd == "resume" && words.size() == 1) {
        if (session.resume()) {
            out << "Game resumed.\n";
        } else {
            out << "The game is not paused.\n";
        }
    } else {
        return false;
    }
    return true;
}

ConsoleOutcome run_console_loop(GameSession &session, SessionClock &clock, mt19937 &rng,
                                istream &in, ostream &out) {
    using steady = chrono::steady_clock;

    print_position(session, clock, out);
    auto last_tick = steady::now();

    string line;
    while (true) {
        out << '\n' << PROMPT;
        if (!getline(in, line)) {
            out << "\nThanks for playing!\n";
            return ConsoleOutcome::EndOfInput;
        }
        auto now = steady::now();
        clock.tick(session, chrono::duration<double>(now - last_tick).count());
        last_tick = now;

        vector<string> words = split_words(line);
        if (!words.empty() && isalpha(static_cast<unsigned char>(words[0][0]))) {
            if (!handle_command(words, session, clock, rng, out)) {
                out << "Invalid input. Please enter row, col\n";
            }
            continue;
        }

        int row = 0;
        int col = 0;
        InputKind kind = parse_move_line(line, row, col);
        if (kind == InputKind::Quit) {
            out << "Thanks for playing!\n";
            return ConsoleOutcome::Quit;
        }
        if (kind == InputKind::Invalid) {
            out << "Invalid input. Please enter row, col\n";
            continue;
        }
        if (session.get_state() == GameState::Paused) {
            out << "Game paused. Type 'resume' to continue.\n";
            continue;
        }
        if (!session.move(row - 1, col - 1)) {
            out << "Invalid move! Tile at (" << row << ", " << col << ") cannot be moved.\n";
            continue;
        }
        print_position(session, clock, out);
        if (session.get_state() == GameState::Won) {
            print_win(session, clock, out);
            return ConsoleOutcome::Solved;
        }
    }
}
