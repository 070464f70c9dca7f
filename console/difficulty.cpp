#include <string>

#include "difficulty.hpp"

using namespace std;

namespace {

struct DifficultyLevel {
    int side_length;
    const char* name;
};

const DifficultyLevel LEVELS[] = {
    {3, "Easy"},
    {4, "Medium"},
    {5, "Hard"},
    {6, "Expert"},
};

const int NUM_LEVELS = sizeof(LEVELS) / sizeof(LEVELS[0]);

}

string difficulty_label(int side_length) {
    string dims = to_string(side_length) + "x" + to_string(side_length);
    for (const auto &level : LEVELS) {
        if (level.side_length == side_length) {
            return string(level.name) + " (" + dims + ")";
        }
    }
    return "Custom (" + dims + ")";
}

int next_difficulty_size(int side_length) {
    for (int i = 0; i < NUM_LEVELS; ++i) {
        if (LEVELS[i].side_length == side_length) {
            return LEVELS[(i + 1) % NUM_LEVELS].side_length;
        }
    }
    return LEVELS[0].side_length;
}
