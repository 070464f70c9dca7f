#ifndef __SESSION_CLOCK_HPP___
#define __SESSION_CLOCK_HPP___

#include <string>

#include "game_session.hpp"

/**
 * @file session_clock.hpp
 * @brief Elapsed play time, driven by explicit ticks from the front-end.
 */

/**
 * @brief Upper bound on the time the formatters display (99999 minutes 59 seconds).
 */
constexpr double MAX_DISPLAY_SECONDS = 99999.0 * 60.0 + 59.0;

/**
 * @brief Accumulates play time for a session.
 *
 * The clock has no timer of its own: the owner calls tick() with the time
 * that passed, and the time only counts while the session is Playing, so
 * pausing or winning stops it.
 */
class SessionClock {

private:
    double elapsed_seconds = 0.0;
public:
    /**
     * @brief Add `seconds` if the session is Playing. Negative, NaN and infinite values are ignored.
     * @return true if the time was counted.
     */
    bool tick(const GameSession &session, double seconds);

    void reset();

    double get_elapsed_seconds() const;
};

/**
 * @brief Format as MM:SS.d (tenths of a second).
 *
 * Negative and NaN inputs print as zero; anything above MAX_DISPLAY_SECONDS
 * (infinity included) prints as MAX_DISPLAY_SECONDS.
 */
std::string format_elapsed(double seconds);

/**
 * @brief Format as MM:SS, with the same clamping as format_elapsed().
 */
std::string format_elapsed_short(double seconds);

#endif // __SESSION_CLOCK_HPP___
