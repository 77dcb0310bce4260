#pragma once

#include <vector>

namespace gridlab {
namespace backtest {

enum class CrossDirection {
    NONE,
    UP,      // sell at each crossed level, ascending
    DOWN     // buy at each crossed level, descending
};

const char* toString(CrossDirection direction);

// Levels traded when the price index moves from prev to curr within one day.
// UP covers prev+1..curr ascending; DOWN covers prev-1 down to curr.
struct LevelCrossing {
    CrossDirection direction = CrossDirection::NONE;
    std::vector<int> levels;

    bool empty() const { return levels.empty(); }
};

LevelCrossing planCrossing(int prev_level, int curr_level);

} // namespace backtest
} // namespace gridlab
