#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <new>
#include <random>
#include <stdexcept>
#include <string>

#include "game_session.hpp"
#include "grid_file_operations.hpp"
#include "session_clock.hpp"
#include "shuffle_generator.hpp"
#include "puzzle_c_api.h"

namespace fs = std::filesystem;

struct PuzzleSession {
    std::mt19937 rng;
    GameSession game;
    SessionClock clock;

    PuzzleSession(int side_size, unsigned int seed)
        : rng(seed), game(new_session(side_size, rng)) {}
};

static int state_code(GameState state) {
    switch (state) {
    case GameState::Playing: return PUZZLE_STATE_PLAYING;
    case GameState::Paused: return PUZZLE_STATE_PAUSED;
    case GameState::Won: return PUZZLE_STATE_WON;
    }
    return PUZZLE_ERR_INTERNAL;
}

extern "C" {

    PuzzleSession* puzzle_session_create(int side_size, unsigned int seed) {
        if (side_size < 2 || side_size > MAX_SIDE_LENGTH) return nullptr;
        try {
            return new PuzzleSession(side_size, seed);
        } catch (const std::exception&) {
            return nullptr;
        }
    }

    void puzzle_session_destroy(PuzzleSession* session) {
        delete session;
    }

    int puzzle_session_side(const PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.get_side_length();
    }

    int puzzle_session_tile_at(const PuzzleSession* session, int row, int col) {
        if (!session || !session->game.get_grid().in_bounds(row, col)) return PUZZLE_ERR_ARGUMENT;
        return session->game.get_grid().tile_at(row, col);
    }

    int puzzle_session_blank_row(const PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.get_blank_position().row;
    }

    int puzzle_session_blank_col(const PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.get_blank_position().col;
    }

    int puzzle_session_can_move(const PuzzleSession* session, int row, int col) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.can_move(row, col) ? 1 : 0;
    }

    int puzzle_session_move(PuzzleSession* session, int row, int col) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.move(row, col) ? 1 : 0;
    }

    int puzzle_session_is_solved(const PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.is_solved() ? 1 : 0;
    }

    int puzzle_session_move_count(const PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.get_move_count();
    }

    int puzzle_session_state(const PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return state_code(session->game.get_state());
    }

    int puzzle_session_restart(PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        try {
            session->game = restart(session->game, session->rng);
            session->clock.reset();
            return 0;
        } catch (const std::exception&) {
            return PUZZLE_ERR_INTERNAL;
        }
    }

    int puzzle_session_change_size(PuzzleSession* session, int side_size) {
        if (!session || side_size < 2 || side_size > MAX_SIDE_LENGTH) return PUZZLE_ERR_ARGUMENT;
        try {
            session->game = change_size(session->game, side_size, session->rng);
            session->clock.reset();
            return 0;
        } catch (const std::exception&) {
            return PUZZLE_ERR_INTERNAL;
        }
    }

    int puzzle_session_pause(PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.pause() ? 1 : 0;
    }

    int puzzle_session_resume(PuzzleSession* session) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->game.resume() ? 1 : 0;
    }

    int puzzle_session_tick(PuzzleSession* session, double seconds) {
        if (!session) return PUZZLE_ERR_ARGUMENT;
        return session->clock.tick(session->game, seconds) ? 1 : 0;
    }

    double puzzle_session_elapsed(const PuzzleSession* session) {
        if (!session) return -1.0;
        return session->clock.get_elapsed_seconds();
    }

    // Generate a solvable puzzle and write it to a file inside out_dir.
    int puzzle_generate_to_file(
        int side_size,
        unsigned int seed,
        const char* out_dir,
        char* out_path_buf,
        int out_path_buf_len
    ) {
        if (side_size < 2 || side_size > MAX_SIDE_LENGTH || !out_dir || !out_path_buf || out_path_buf_len <= 0) return PUZZLE_ERR_ARGUMENT;
        try {
            // ensure directory exists
            fs::create_directories(out_dir);

            // build unique filename
            auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
            std::string fname = "puzzle_" + std::to_string(side_size) + "x" + std::to_string(side_size)
                + "_" + std::to_string(seed) + "_" + std::to_string(now) + ".grid";
            fs::path full = fs::path(out_dir) / fname;

            std::string p = full.string();
            if ((int)p.size() + 1 > out_path_buf_len) return PUZZLE_ERR_BUFFER;

            std::mt19937 rng(seed);
            Grid grid = generate_solvable_grid(side_size, rng);
            write_grid_to_file(grid, p);

            std::memcpy(out_path_buf, p.c_str(), p.size() + 1);
            return 0;
        } catch (const std::exception&) {
            return PUZZLE_ERR_INTERNAL;
        }
    }
}
