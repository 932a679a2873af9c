#include "rankcore/core/standings/OpponentStats.h"

#include <algorithm>

namespace rankcore::core::standings {

namespace {

double Divide(double numerator, double denominator) {
    return denominator > 0.0 ? numerator / denominator : 0.0;
}

double Clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

}  // namespace

double ComputeMwp(const Totals& totals) {
    return Divide(totals.wins + 0.5 * totals.draws, totals.decisive_matches());
}

double ComputeGwp(const Totals& totals, double floor) {
    // A bye counts as a 2-0 game win.
    const double bye_game_wins = 2.0 * totals.byes;
    const double numerator = totals.game_wins + bye_game_wins + 0.5 * totals.game_draws;
    const double denominator = totals.game_wins + totals.game_losses + totals.game_draws + bye_game_wins;
    return std::max(floor, Divide(numerator, denominator));
}

double OpponentPctExcludingSubject(const PlayerId& subject,
                                   const std::vector<Match>& opponent_matches,
                                   bool game_pct) {
    int wins = 0;
    int losses = 0;
    int draws = 0;
    int game_wins = 0;
    int game_losses = 0;
    int game_draws = 0;
    for (const auto& match : opponent_matches) {
        if (match.is_bye() || *match.opponent_id == subject || match.result == MatchResult::Bye) {
            continue;
        }
        if (IsWinResult(match.result)) {
            ++wins;
        } else if (IsLossResult(match.result)) {
            ++losses;
        } else if (match.result == MatchResult::Draw) {
            ++draws;
        }
        game_wins += match.game_wins;
        game_losses += match.game_losses;
        game_draws += match.game_draws;
    }

    if (game_pct) {
        return Divide(game_wins + 0.5 * game_draws, game_wins + game_losses + game_draws);
    }
    return Divide(wins + 0.5 * draws, wins + losses + draws);
}

double AverageWithFloor(const std::vector<double>& values, double floor) {
    if (values.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (double value : values) {
        total += std::max(floor, value);
    }
    return total / static_cast<double>(values.size());
}

OpponentPercentages ComputeOpponentPercentages(const PlayerId& subject,
                                               const Totals& totals,
                                               const MatchesByPlayer& by_player,
                                               double floor,
                                               const VirtualByeConfig& virtual_bye) {
    static const std::vector<Match> kNoMatches;

    std::vector<double> match_pcts;
    std::vector<double> game_pcts;
    match_pcts.reserve(totals.opponents.size() + static_cast<size_t>(totals.byes));
    game_pcts.reserve(totals.opponents.size() + static_cast<size_t>(totals.byes));

    for (const auto& opponent : totals.opponents) {
        const auto it = by_player.find(opponent);
        const auto& opponent_matches = it != by_player.end() ? it->second : kNoMatches;
        match_pcts.push_back(OpponentPctExcludingSubject(subject, opponent_matches, false));
        game_pcts.push_back(OpponentPctExcludingSubject(subject, opponent_matches, true));
    }

    if (virtual_bye.enabled) {
        const double virtual_mwp = Clamp01(virtual_bye.mwp);
        const double virtual_gwp = Clamp01(virtual_bye.gwp);
        for (int i = 0; i < totals.byes; ++i) {
            match_pcts.push_back(virtual_mwp);
            game_pcts.push_back(virtual_gwp);
        }
    }

    OpponentPercentages result;
    result.omwp = AverageWithFloor(match_pcts, floor);
    result.ogwp = AverageWithFloor(game_pcts, floor);
    return result;
}

double ComputeSonnebornBerger(const std::vector<Match>& matches,
                              const std::map<PlayerId, double>& final_match_points) {
    double sb = 0.0;
    for (const auto& match : matches) {
        if (match.is_bye()) {
            continue;
        }
        const auto it = final_match_points.find(*match.opponent_id);
        const double opponent_points = it != final_match_points.end() ? it->second : 0.0;
        if (IsWinResult(match.result)) {
            sb += opponent_points;
        } else if (match.result == MatchResult::Draw) {
            sb += 0.5 * opponent_points;
        }
    }
    return sb;
}

}  // namespace rankcore::core::standings
