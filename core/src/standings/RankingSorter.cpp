#include "rankcore/core/standings/RankingSorter.h"

#include "rankcore/core/util/DeterministicHash.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <utility>

namespace rankcore::core::standings {

namespace {

bool NearlyEqual(double a, double b) {
    return std::fabs(a - b) < kTieEpsilon;
}

bool AllPenaltiesEqual(const std::vector<StandingRow>& block) {
    return std::all_of(block.begin(), block.end(), [&](const StandingRow& row) {
        return row.penalties == block.front().penalties;
    });
}

void ResolveByPenalties(std::vector<StandingRow>& block, const TieBreakSettings& settings) {
    std::stable_sort(block.begin(), block.end(), [](const StandingRow& a, const StandingRow& b) {
        return a.penalties < b.penalties;
    });
    if (AllPenaltiesEqual(block)) {
        SortByFallbackHash(block, settings.event_id, settings.fallback_role);
    }
}

void ResolveTieBlock(std::vector<StandingRow>& block,
                     const MatchesByPlayer& by_player,
                     const TieBreakSettings& settings) {
    if (settings.apply_head_to_head) {
        std::vector<PlayerId> ids;
        ids.reserve(block.size());
        for (const auto& row : block) {
            ids.push_back(row.player_id);
        }
        const auto order = HeadToHeadOrder(ids, by_player);
        if (order && !order->empty()) {
            std::map<PlayerId, size_t> position;
            for (size_t i = 0; i < order->size(); ++i) {
                position[(*order)[i]] = i;
            }
            std::stable_sort(block.begin(), block.end(), [&](const StandingRow& a, const StandingRow& b) {
                return position[a.player_id] < position[b.player_id];
            });
            return;
        }
    }
    ResolveByPenalties(block, settings);
}

}  // namespace

bool SameTieKey(const StandingRow& a, const StandingRow& b) {
    return a.match_points == b.match_points &&
           NearlyEqual(a.omwp, b.omwp) &&
           NearlyEqual(a.gwp, b.gwp) &&
           NearlyEqual(a.ogwp, b.ogwp) &&
           NearlyEqual(a.sb, b.sb);
}

bool RanksAhead(const StandingRow& a, const StandingRow& b) {
    if (a.match_points != b.match_points) {
        return a.match_points > b.match_points;
    }
    if (!NearlyEqual(a.omwp, b.omwp)) {
        return a.omwp > b.omwp;
    }
    if (!NearlyEqual(a.gwp, b.gwp)) {
        return a.gwp > b.gwp;
    }
    if (!NearlyEqual(a.ogwp, b.ogwp)) {
        return a.ogwp > b.ogwp;
    }
    if (!NearlyEqual(a.sb, b.sb)) {
        return a.sb > b.sb;
    }
    return false;
}

std::optional<std::vector<PlayerId>> HeadToHeadOrder(const std::vector<PlayerId>& tied,
                                                     const MatchesByPlayer& by_player) {
    std::map<PlayerId, double> scores;
    for (const auto& id : tied) {
        scores[id] = 0.0;
    }

    for (const auto& id : tied) {
        const auto it = by_player.find(id);
        if (it == by_player.end()) {
            continue;
        }
        for (const auto& match : it->second) {
            if (match.is_bye() || scores.count(*match.opponent_id) == 0) {
                continue;
            }
            if (IsWinResult(match.result)) {
                scores[id] += 1.0;
            } else if (match.result == MatchResult::Draw) {
                scores[id] += 0.5;
            }
        }
    }

    std::vector<PlayerId> ordered = tied;
    std::stable_sort(ordered.begin(), ordered.end(), [&](const PlayerId& a, const PlayerId& b) {
        return scores[a] > scores[b];
    });

    for (size_t i = 1; i < ordered.size(); ++i) {
        if (std::fabs(scores[ordered[i]] - scores[ordered[i - 1]]) < 1e-9) {
            return std::nullopt;
        }
    }
    return ordered;
}

void SortByFallbackHash(std::vector<StandingRow>& block,
                        const std::string& event_id,
                        const std::string& role) {
    std::map<PlayerId, std::uint32_t> keys;
    for (const auto& row : block) {
        keys[row.player_id] = util::TieBreakHash(event_id, role, row.player_id);
    }
    std::sort(block.begin(), block.end(), [&](const StandingRow& a, const StandingRow& b) {
        const auto ka = keys[a.player_id];
        const auto kb = keys[b.player_id];
        if (ka != kb) {
            return ka < kb;
        }
        return a.player_id < b.player_id;
    });
}

void SortStandings(std::vector<StandingRow>& rows,
                   const MatchesByPlayer& by_player,
                   const TieBreakSettings& settings) {
    std::stable_sort(rows.begin(), rows.end(), RanksAhead);

    size_t i = 0;
    while (i < rows.size()) {
        size_t j = i + 1;
        while (j < rows.size() && SameTieKey(rows[i], rows[j])) {
            ++j;
        }
        if (j - i > 1) {
            std::vector<StandingRow> block(std::make_move_iterator(rows.begin() + static_cast<std::ptrdiff_t>(i)),
                                           std::make_move_iterator(rows.begin() + static_cast<std::ptrdiff_t>(j)));
            ResolveTieBlock(block, by_player, settings);
            std::move(block.begin(), block.end(), rows.begin() + static_cast<std::ptrdiff_t>(i));
        }
        i = j;
    }

    AssignRanks(rows);
}

void AssignRanks(std::vector<StandingRow>& rows) {
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].rank = static_cast<int>(i + 1);
    }
}

}  // namespace rankcore::core::standings
