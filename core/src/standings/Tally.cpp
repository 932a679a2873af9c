#include "rankcore/core/standings/Tally.h"

namespace rankcore::core::standings {

double PointsForResult(MatchResult result, const PointsMap& points) {
    switch (result) {
        case MatchResult::Win:
        case MatchResult::ForfeitWin:
            return points.win;
        case MatchResult::Draw:
            return points.draw;
        case MatchResult::Loss:
        case MatchResult::ForfeitLoss:
            return points.loss;
        case MatchResult::Bye:
            return points.bye;
    }
    return points.loss;
}

void TallyAccumulator::RecordMatch(const Match& match) {
    totals_.match_points += PointsForResult(match.result, points_);
    totals_.rounds_played += 1;

    if (IsWinResult(match.result)) {
        totals_.wins += 1;
    } else if (IsLossResult(match.result)) {
        totals_.losses += 1;
    } else if (match.result == MatchResult::Draw) {
        totals_.draws += 1;
    } else if (match.result == MatchResult::Bye) {
        totals_.byes += 1;
    }

    totals_.game_wins += match.game_wins;
    totals_.game_losses += match.game_losses;
    totals_.game_draws += match.game_draws;
    totals_.penalties += match.penalties;

    if (!match.is_bye()) {
        totals_.opponents.push_back(*match.opponent_id);
    }
}

Totals Tally(const std::vector<Match>& matches, const PointsMap& points) {
    TallyAccumulator accumulator(points);
    for (const auto& match : matches) {
        accumulator.RecordMatch(match);
    }
    return accumulator.totals();
}

}  // namespace rankcore::core::standings
