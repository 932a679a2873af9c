#include "rankcore/core/standings/StandingsEngine.h"

#include "rankcore/core/standings/OpponentStats.h"
#include "rankcore/core/standings/RankingSorter.h"
#include "rankcore/core/standings/Tally.h"
#include "rankcore/core/util/DeterministicHash.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <sstream>

namespace rankcore::core::standings {

namespace {

struct TieBreakInputs {
    PointsMap points;
    double floor = kDefaultOpponentPctFloor;
    VirtualByeConfig virtual_bye;
};

bool RejectSelfPairing(const std::vector<Match>& matches, std::string* error) {
    const Match* self = FindSelfPairing(matches);
    if (!self) {
        return false;
    }
    if (error) {
        std::ostringstream out;
        out << "Match " << self->id << " pairs " << self->player_id << " against itself in round "
            << self->round << ".";
        *error = out.str();
    }
    return true;
}

std::vector<StandingRow> BuildTieBreakRows(const MatchesByPlayer& by_player, const TieBreakInputs& inputs) {
    std::vector<StandingRow> rows;
    rows.reserve(by_player.size());
    std::map<PlayerId, Totals> totals_by_player;

    for (const auto& entry : by_player) {
        const Totals totals = Tally(entry.second, inputs.points);
        StandingRow row;
        row.player_id = entry.first;
        row.match_points = totals.match_points;
        row.mwp = ComputeMwp(totals);
        row.gwp = ComputeGwp(totals, inputs.floor);
        row.wins = totals.wins;
        row.losses = totals.losses;
        row.draws = totals.draws;
        row.byes = totals.byes;
        row.rounds_played = totals.rounds_played;
        row.game_wins = totals.game_wins + 2 * totals.byes;
        row.game_losses = totals.game_losses;
        row.game_draws = totals.game_draws;
        row.penalties = totals.penalties;
        row.opponents = totals.opponents;
        rows.push_back(std::move(row));
        totals_by_player.emplace(entry.first, totals);
    }

    std::map<PlayerId, double> final_match_points;
    for (auto& row : rows) {
        const auto& totals = totals_by_player.at(row.player_id);
        const auto pcts = ComputeOpponentPercentages(row.player_id, totals, by_player, inputs.floor,
                                                     inputs.virtual_bye);
        row.omwp = pcts.omwp;
        row.ogwp = pcts.ogwp;
        final_match_points[row.player_id] = row.match_points;
    }

    for (auto& row : rows) {
        row.sb = ComputeSonnebornBerger(by_player.at(row.player_id), final_match_points);
    }
    return rows;
}

// Unseeded players sort after every seeded one.
int SeedOf(const SingleEliminationOptions& options, const PlayerId& id) {
    const auto it = options.seeding.find(id);
    return it != options.seeding.end() ? it->second : std::numeric_limits<int>::max();
}

}  // namespace

bool ComputeSwissStandings(const std::vector<Match>& matches,
                           const SwissStandingsOptions& options,
                           std::vector<StandingRow>& standings,
                           std::string* error) {
    if (RejectSelfPairing(matches, error)) {
        return false;
    }

    const auto by_player = GroupByPlayer(options.accept_single_entry_matches ? MirrorSingleEntryMatches(matches)
                                                                             : matches);
    TieBreakInputs inputs;
    inputs.points = options.points;
    inputs.floor = options.opponent_pct_floor;
    inputs.virtual_bye = options.virtual_bye;
    auto rows = BuildTieBreakRows(by_player, inputs);

    TieBreakSettings settings;
    settings.event_id = options.event_id;
    settings.fallback_role = roles::kSwissFallback;
    settings.apply_head_to_head = options.apply_head_to_head;
    SortStandings(rows, by_player, settings);

    standings = std::move(rows);
    return true;
}

bool ComputeRoundRobinStandings(const std::vector<Match>& matches,
                                const RoundRobinStandingsOptions& options,
                                std::vector<StandingRow>& standings,
                                std::string* error) {
    if (RejectSelfPairing(matches, error)) {
        return false;
    }

    if (!options.accept_single_entry_matches) {
        const auto missing = FindMissingMirrors(matches);
        if (!missing.empty()) {
            if (error) {
                const auto& sample = missing.front();
                std::ostringstream out;
                out << "roundrobin: missing mirrored entry for " << sample.player_id << " vs "
                    << *sample.opponent_id << " in round " << sample.round
                    << ". Set accept_single_entry_matches to reconstruct it.";
                *error = out.str();
            }
            return false;
        }
    }

    const auto by_player = GroupByPlayer(
        options.accept_single_entry_matches ? MirrorSingleEntryMatches(matches, MirrorPenalties::CopyFromEntry)
                                            : matches);
    TieBreakInputs inputs;
    inputs.points = options.points;
    inputs.floor = options.opponent_pct_floor;
    auto rows = BuildTieBreakRows(by_player, inputs);

    TieBreakSettings settings;
    settings.event_id = options.event_id;
    settings.fallback_role = roles::kRoundRobinFallback;
    settings.apply_head_to_head = options.apply_head_to_head;
    SortStandings(rows, by_player, settings);

    standings = std::move(rows);
    return true;
}

std::vector<StandingRow> ComputeSingleEliminationStandings(const std::vector<Match>& matches,
                                                           const SingleEliminationOptions& options) {
    const auto by_player = GroupByPlayer(matches);

    int max_round = 0;
    for (const auto& match : matches) {
        max_round = std::max(max_round, match.round);
    }

    std::vector<StandingRow> rows;
    rows.reserve(by_player.size());
    for (const auto& entry : by_player) {
        const auto& list = entry.second;
        StandingRow row;
        row.player_id = entry.first;
        row.rounds_played = static_cast<int>(list.size());
        for (const auto& match : list) {
            if (IsWinResult(match.result)) {
                row.wins += 1;
            } else if (IsLossResult(match.result)) {
                row.losses += 1;
            }
            row.game_wins += match.game_wins;
            row.game_losses += match.game_losses;
            row.game_draws += match.game_draws;
            row.penalties += match.penalties;
            if (!match.is_bye()) {
                row.opponents.push_back(*match.opponent_id);
            }
        }
        row.match_points = row.wins;

        const Match& last = list.back();
        if (last.round == max_round && IsWinResult(last.result)) {
            row.elim_round = max_round + 1;
        } else {
            row.elim_round = last.round;
        }
        rows.push_back(std::move(row));
    }

    std::map<PlayerId, std::uint32_t> fallback;
    for (const auto& row : rows) {
        fallback[row.player_id] = util::TieBreakHash(options.event_id, roles::kSingleElimination, row.player_id);
    }

    std::sort(rows.begin(), rows.end(), [&](const StandingRow& a, const StandingRow& b) {
        if (a.elim_round != b.elim_round) {
            return a.elim_round > b.elim_round;
        }
        const int seed_a = SeedOf(options, a.player_id);
        const int seed_b = SeedOf(options, b.player_id);
        if (seed_a != seed_b) {
            return seed_a < seed_b;
        }
        if (a.penalties != b.penalties) {
            return a.penalties < b.penalties;
        }
        const auto ha = fallback[a.player_id];
        const auto hb = fallback[b.player_id];
        if (ha != hb) {
            return ha < hb;
        }
        return a.player_id < b.player_id;
    });

    AssignRanks(rows);
    return rows;
}

bool ComputeStandings(const StandingsRequest& request,
                      std::vector<StandingRow>& standings,
                      std::string* error) {
    if (request.mode == "swiss") {
        return ComputeSwissStandings(request.matches, request.swiss, standings, error);
    }
    if (request.mode == "roundrobin") {
        return ComputeRoundRobinStandings(request.matches, request.round_robin, standings, error);
    }
    if (request.mode == "singleelimination") {
        standings = ComputeSingleEliminationStandings(request.matches, request.single_elimination);
        return true;
    }
    if (error) {
        *error = "Unsupported standings mode: " + request.mode;
    }
    return false;
}

}  // namespace rankcore::core::standings
