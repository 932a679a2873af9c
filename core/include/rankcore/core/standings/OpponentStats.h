#pragma once

#include "rankcore/core/standings/MatchIndex.h"
#include "rankcore/core/standings/Tally.h"

#include <map>
#include <vector>

namespace rankcore::core::standings {

double ComputeMwp(const Totals& totals);
double ComputeGwp(const Totals& totals, double floor);

// Opponent's match- or game-win percentage, ignoring its byes and every record against `subject`.
double OpponentPctExcludingSubject(const PlayerId& subject,
                                   const std::vector<Match>& opponent_matches,
                                   bool game_pct);

// Mean of the values after flooring each one; 0 for an empty list.
double AverageWithFloor(const std::vector<double>& values, double floor);

struct OpponentPercentages {
    double omwp = 0.0;
    double ogwp = 0.0;
};

OpponentPercentages ComputeOpponentPercentages(const PlayerId& subject,
                                               const Totals& totals,
                                               const MatchesByPlayer& by_player,
                                               double floor,
                                               const VirtualByeConfig& virtual_bye);

// Needs every competitor's final match points.
double ComputeSonnebornBerger(const std::vector<Match>& matches,
                              const std::map<PlayerId, double>& final_match_points);

}  // namespace rankcore::core::standings
