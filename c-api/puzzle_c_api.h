/**
 * @file puzzle_c_api.h
 * @brief C-friendly wrapper around the puzzle engine for GUI/touch front-ends
 * (loaded through FFI, e.g. Python ctypes or a Swift bridging header).
 *
 * Sessions are opaque handles. Functions returning int use negative values
 * for errors: PUZZLE_ERR_ARGUMENT for null handles or bad parameters,
 * PUZZLE_ERR_INTERNAL when the engine raised an unexpected error.
 */

#ifndef __PUZZLE_C_API_H___
#define __PUZZLE_C_API_H___

#ifdef __cplusplus
extern "C" {
#endif

#define PUZZLE_STATE_PLAYING 0
#define PUZZLE_STATE_PAUSED 1
#define PUZZLE_STATE_WON 2

#define PUZZLE_ERR_ARGUMENT (-1)
#define PUZZLE_ERR_BUFFER (-2)
#define PUZZLE_ERR_INTERNAL (-3)

typedef struct PuzzleSession PuzzleSession;

/* Returns NULL if side_size is outside 2..100 or allocation fails. */
PuzzleSession* puzzle_session_create(int side_size, unsigned int seed);
void puzzle_session_destroy(PuzzleSession* session);

int puzzle_session_side(const PuzzleSession* session);
/* Tile value at (row, col), 0-based; 0 is the blank. */
int puzzle_session_tile_at(const PuzzleSession* session, int row, int col);
int puzzle_session_blank_row(const PuzzleSession* session);
int puzzle_session_blank_col(const PuzzleSession* session);

/* 1 / 0 */
int puzzle_session_can_move(const PuzzleSession* session, int row, int col);
/* 1 if applied, 0 if rejected. */
int puzzle_session_move(PuzzleSession* session, int row, int col);
int puzzle_session_is_solved(const PuzzleSession* session);
int puzzle_session_move_count(const PuzzleSession* session);
int puzzle_session_state(const PuzzleSession* session);

/* 0 on success. Both reset the elapsed time. */
int puzzle_session_restart(PuzzleSession* session);
int puzzle_session_change_size(PuzzleSession* session, int side_size);

/* 1 if the state changed, 0 otherwise. */
int puzzle_session_pause(PuzzleSession* session);
int puzzle_session_resume(PuzzleSession* session);

/* Advance the session clock; 1 if the time was counted (session playing). */
int puzzle_session_tick(PuzzleSession* session, double seconds);
/* Elapsed play time in seconds, negative for a NULL handle. */
double puzzle_session_elapsed(const PuzzleSession* session);

/*
 * Generate a solvable puzzle and write it to a file inside out_dir.
 * Returns 0 on success, negative on error. On success, writes the full
 * path into out_path_buf (NUL-terminated) if buffer is large enough.
 */
int puzzle_generate_to_file(int side_size, unsigned int seed, const char* out_dir,
                            char* out_path_buf, int out_path_buf_len);

#ifdef __cplusplus
}
#endif

#endif // __PUZZLE_C_API_H___
