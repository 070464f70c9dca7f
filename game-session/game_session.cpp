#include <cassert>
#include <random>
#include <stdexcept>
#include <string>

#include "game_session.hpp"
#include "shuffle_generator.hpp"
#include "solvability.hpp"
#include "win_detector.hpp"

using namespace std;

GameSession::GameSession(const Grid& grid) : grid(grid) {
    if (grid.get_side_length() < 2) {
        throw invalid_argument("Puzzle side length must be at least 2");
    }
    if (!::is_solvable(this->grid)) {
        repair_solvability(this->grid);
    }
    blank = this->grid.locate_blank();
    solvable = true;
    assert(::is_solvable(this->grid));
}

const Grid& GameSession::get_grid() const {
    return grid;
}

int GameSession::get_side_length() const {
    return grid.get_side_length();
}

Position GameSession::get_blank_position() const {
    return blank;
}

int GameSession::get_move_count() const {
    return move_count;
}

bool GameSession::is_solvable() const {
    return solvable;
}

GameState GameSession::get_state() const {
    return state;
}

bool GameSession::can_move(int row, int col) const {
    if (state != GameState::Playing) return false;
    if (!grid.in_bounds(row, col)) return false;
    Position target{row, col};
    if (target == blank) return false;
    return is_adjacent(target, blank);
}

bool GameSession::move(int row, int col) {
    if (!can_move(row, col)) return false;
    Position target{row, col};
    grid.swap_tiles(target, blank);
    blank = target;
    ++move_count;
    assert(grid.tile_at(blank.row, blank.col) == 0);
    if (::is_solved(grid)) {
        state = GameState::Won;
    }
    return true;
}

bool GameSession::is_solved() const {
    return ::is_solved(grid);
}

bool GameSession::pause() {
    if (state != GameState::Playing) return false;
    state = GameState::Paused;
    return true;
}

bool GameSession::resume() {
    if (state != GameState::Paused) return false;
    state = GameState::Playing;
    return true;
}

GameSession new_session(int side_length, mt19937 &rng) {
    if (side_length < 2 || side_length > MAX_SIDE_LENGTH) {
        throw invalid_argument("Puzzle side length must be in [2," + to_string(MAX_SIDE_LENGTH) + "]");
    }
    return GameSession(generate_solvable_grid(side_length, rng));
}

GameSession restart(const GameSession &session, mt19937 &rng) {
    return new_session(session.get_side_length(), rng);
}

GameSession change_size(const GameSession &, int new_side_length, mt19937 &rng) {
    return new_session(new_side_length, rng);
}
