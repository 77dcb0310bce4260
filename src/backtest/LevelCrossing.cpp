#include "backtest/LevelCrossing.h"

namespace gridlab {
namespace backtest {

const char* toString(CrossDirection direction) {
    switch (direction) {
        case CrossDirection::UP:   return "UP";
        case CrossDirection::DOWN: return "DOWN";
        default:                   return "NONE";
    }
}

LevelCrossing planCrossing(int prev_level, int curr_level) {
    LevelCrossing crossing;
    if (curr_level > prev_level) {
        crossing.direction = CrossDirection::UP;
        for (int level = prev_level + 1; level <= curr_level; level++) {
            crossing.levels.push_back(level);
        }
    } else if (curr_level < prev_level) {
        crossing.direction = CrossDirection::DOWN;
        for (int level = prev_level - 1; level >= curr_level; level--) {
            crossing.levels.push_back(level);
        }
    }
    return crossing;
}

} // namespace backtest
} // namespace gridlab
