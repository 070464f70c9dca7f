#include <cmath>
#include <cstdio>
#include <string>

#include "session_clock.hpp"

using namespace std;

bool SessionClock::tick(const GameSession &session, double seconds) {
    if (!isfinite(seconds) || seconds < 0.0 || session.get_state() != GameState::Playing) return false;
    elapsed_seconds += seconds;
    return true;
}

void SessionClock::reset() {
    elapsed_seconds = 0.0;
}

double SessionClock::get_elapsed_seconds() const {
    return elapsed_seconds;
}

// Non-finite and negative values show as zero; huge values saturate.
static double displayable_seconds(double seconds) {
    if (!isfinite(seconds) && seconds > 0.0) return MAX_DISPLAY_SECONDS;
    if (!(seconds > 0.0)) return 0.0;
    return seconds < MAX_DISPLAY_SECONDS ? seconds : MAX_DISPLAY_SECONDS;
}

string format_elapsed(double seconds) {
    long long tenths_total = static_cast<long long>(displayable_seconds(seconds) * 10.0);
    long long minutes = tenths_total / 600;
    long long secs = (tenths_total / 10) % 60;
    long long tenths = tenths_total % 10;
    char buf[48];
    snprintf(buf, sizeof(buf), "%02lld:%02lld.%lld", minutes, secs, tenths);
    return string(buf);
}

string format_elapsed_short(double seconds) {
    long long total = static_cast<long long>(displayable_seconds(seconds));
    char buf[48];
    snprintf(buf, sizeof(buf), "%02lld:%02lld", total / 60, total % 60);
    return string(buf);
}
