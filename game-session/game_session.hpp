/**
 * @file game_session.hpp
 * @brief One game of the sliding puzzle: grid ownership, moves and state.
 */

#ifndef __GAME_SESSION_HPP___
#define __GAME_SESSION_HPP___

#include <random>

#include "grid.hpp"

enum class GameState {
    Playing,
    Paused,
    Won
};

/**
 * @brief Mutable owner of a puzzle grid during play.
 *
 * The session keeps the blank position in sync with the grid on every move
 * instead of scanning for it. Front-ends only get const views of the grid;
 * move() is the only mutator during play.
 *
 * State machine: Playing <-> Paused via pause()/resume(); Playing -> Won via
 * a solving move. Won is terminal; a new session is needed to play again.
 */
class GameSession {

private:
    Grid grid;
    Position blank{0, 0};
    int move_count = 0;
    bool solvable = true;
    GameState state = GameState::Playing;
public:
    /**
     * @brief Start a session on an externally supplied arrangement.
     *
     * The arrangement is repaired once if it fails the solvability check.
     * @throws std::invalid_argument if the side length is below 2.
     */
    explicit GameSession(const Grid& grid);

    const Grid& get_grid() const;
    int get_side_length() const;
    Position get_blank_position() const;
    int get_move_count() const;
    bool is_solvable() const;
    GameState get_state() const;

    /**
     * @brief Whether the tile at (row, col) may slide into the blank.
     *
     * False for cells off the board, the blank itself, cells not adjacent to
     * the blank, and whenever the session is not Playing.
     */
    bool can_move(int row, int col) const;

    /**
     * @brief Slide the tile at (row, col) into the blank.
     *
     * On success the move counter is incremented and the session switches to
     * Won if the grid is now solved.
     * @return true if the move was applied, false if rejected (no state change).
     */
    bool move(int row, int col);

    bool is_solved() const;

    /**
     * @brief Playing -> Paused. Returns false from any other state.
     */
    bool pause();

    /**
     * @brief Paused -> Playing. Returns false from any other state.
     */
    bool resume();
};

/**
 * @brief Generate a new solvable session.
 *
 * @param side_length Board side length (2..MAX_SIDE_LENGTH).
 * @param rng Random number generator used for the shuffle.
 * @throws std::invalid_argument if side_length is outside 2..MAX_SIDE_LENGTH.
 */
GameSession new_session(int side_length, std::mt19937 &rng);

/**
 * @brief Fresh session at the current session's size.
 */
GameSession restart(const GameSession &session, std::mt19937 &rng);

/**
 * @brief Fresh session at a new size.
 * @throws std::invalid_argument if new_side_length is outside 2..MAX_SIDE_LENGTH.
 */
GameSession change_size(const GameSession &session, int new_side_length, std::mt19937 &rng);

#endif // __GAME_SESSION_HPP___
