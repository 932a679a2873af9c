#include "rankcore/core/standings/MatchIndex.h"

#include <algorithm>
#include <set>
#include <tuple>

namespace rankcore::core::standings {

namespace {

using DirectedKey = std::tuple<int, PlayerId, PlayerId>;

Match BuildMirror(const Match& match, MirrorPenalties penalties) {
    Match mirror;
    mirror.id = match.id + "#mirror";
    mirror.round = match.round;
    mirror.player_id = *match.opponent_id;
    mirror.opponent_id = match.player_id;
    mirror.result = FlipResult(match.result);
    mirror.game_wins = match.game_losses;
    mirror.game_losses = match.game_wins;
    mirror.game_draws = match.game_draws;
    mirror.penalties = penalties == MirrorPenalties::CopyFromEntry ? match.penalties : 0;
    return mirror;
}

}  // namespace

MatchesByPlayer GroupByPlayer(const std::vector<Match>& matches) {
    MatchesByPlayer by_player;
    for (const auto& match : matches) {
        by_player[match.player_id].push_back(match);
    }
    for (auto& entry : by_player) {
        std::stable_sort(entry.second.begin(), entry.second.end(), [](const Match& a, const Match& b) {
            if (a.round != b.round) {
                return a.round < b.round;
            }
            return a.id < b.id;
        });
    }
    return by_player;
}

std::vector<Match> FindMissingMirrors(const std::vector<Match>& matches) {
    std::set<DirectedKey> seen;
    for (const auto& match : matches) {
        if (!match.is_bye()) {
            seen.emplace(match.round, match.player_id, *match.opponent_id);
        }
    }

    std::vector<Match> missing;
    std::set<DirectedKey> reported;
    for (const auto& match : matches) {
        if (match.is_bye()) {
            continue;
        }
        const DirectedKey reverse{match.round, *match.opponent_id, match.player_id};
        if (seen.count(reverse) == 0 && reported.insert(reverse).second) {
            missing.push_back(match);
        }
    }
    return missing;
}

std::vector<Match> MirrorSingleEntryMatches(const std::vector<Match>& matches, MirrorPenalties penalties) {
    std::vector<Match> out = matches;
    for (const auto& match : FindMissingMirrors(matches)) {
        out.push_back(BuildMirror(match, penalties));
    }
    return out;
}

const Match* FindSelfPairing(const std::vector<Match>& matches) {
    for (const auto& match : matches) {
        if (!match.is_bye() && *match.opponent_id == match.player_id) {
            return &match;
        }
    }
    return nullptr;
}

}  // namespace rankcore::core::standings
