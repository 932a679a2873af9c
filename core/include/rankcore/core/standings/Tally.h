#pragma once

#include "rankcore/core/standings/MatchTypes.h"

#include <vector>

namespace rankcore::core::standings {

struct Totals {
    int wins = 0;
    int losses = 0;
    int draws = 0;
    int byes = 0;
    double match_points = 0.0;
    int game_wins = 0;
    int game_losses = 0;
    int game_draws = 0;
    int penalties = 0;
    int rounds_played = 0;
    std::vector<PlayerId> opponents;

    int decisive_matches() const { return wins + losses + draws; }
};

double PointsForResult(MatchResult result, const PointsMap& points);

// Accumulates one competitor's records; each instance is owned by a single row build.
class TallyAccumulator {
public:
    explicit TallyAccumulator(PointsMap points) : points_(points) {}

    void RecordMatch(const Match& match);
    const Totals& totals() const { return totals_; }

private:
    PointsMap points_;
    Totals totals_;
};

Totals Tally(const std::vector<Match>& matches, const PointsMap& points);

}  // namespace rankcore::core::standings
