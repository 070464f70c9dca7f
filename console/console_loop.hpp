#ifndef __CONSOLE_LOOP_HPP___
#define __CONSOLE_LOOP_HPP___

#include <istream>
#include <ostream>
#include <random>
#include <string>

#include "game_session.hpp"
#include "session_clock.hpp"

/**
 * @file console_loop.hpp
 * @brief Read-eval loop for the text console and for scripted sessions.
 *
 * Moves are typed as a 1-indexed "row, col" pair. Accepted shapes include
 * "2 3", "2,3", "(2, 3)" and "[2 3]". A line of nothing but zeros ("0",
 * "0 0", "0 0 0", ...), an empty line or end of input ends the session.
 * Input with the wrong number of values, or with non-numeric values,
 * re-prompts and is not counted as a move. The words restart, size [N],
 * pause, resume and help are commands.
 */

enum class ConsoleOutcome {
    Solved,
    Quit,
    EndOfInput
};

enum class InputKind {
    Move,
    Quit,
    Invalid
};

/**
 * @brief Classify one input line as a move, a quit request or invalid input.
 *
 * @param line Raw line without the trailing newline.
 * @param row Receives the 1-indexed row when the result is InputKind::Move.
 * @param col Receives the 1-indexed column when the result is InputKind::Move.
 */
InputKind parse_move_line(const std::string &line, int &row, int &col);

/**
 * @brief Run the game until it is solved, the player quits or input ends.
 *
 * The session and clock are updated in place; restart and size commands
 * replace the session with a freshly generated one.
 */
ConsoleOutcome run_console_loop(GameSession &session, SessionClock &clock, std::mt19937 &rng,
                                std::istream &in, std::ostream &out);

#endif // __CONSOLE_LOOP_HPP___
