#pragma once

#include "rankcore/core/standings/MatchIndex.h"

#include <optional>
#include <string>
#include <vector>

namespace rankcore::core::standings {

constexpr double kTieEpsilon = 1e-12;

namespace roles {
constexpr const char* kSwissFallback = "fallback";
constexpr const char* kRoundRobinFallback = "rr-fallback";
constexpr const char* kSingleElimination = "single-elim";
constexpr const char* kPairingFallback = "pairing-fallback";
}  // namespace roles

struct TieBreakSettings {
    std::string event_id = kDefaultEventId;
    std::string fallback_role = roles::kSwissFallback;
    bool apply_head_to_head = true;
};

// Match points, OMW%, GWP, OGW% and SB all equal.
bool SameTieKey(const StandingRow& a, const StandingRow& b);

// Descending cascade over the five tie-break keys.
bool RanksAhead(const StandingRow& a, const StandingRow& b);

// Order of `tied` by results among themselves, or nullopt when two sub-scores are equal.
std::optional<std::vector<PlayerId>> HeadToHeadOrder(const std::vector<PlayerId>& tied,
                                                     const MatchesByPlayer& by_player);

// Ascending by TieBreakHash(event_id, role, id), id as the last key.
void SortByFallbackHash(std::vector<StandingRow>& block,
                        const std::string& event_id,
                        const std::string& role);

void SortStandings(std::vector<StandingRow>& rows,
                   const MatchesByPlayer& by_player,
                   const TieBreakSettings& settings);

void AssignRanks(std::vector<StandingRow>& rows);

}  // namespace rankcore::core::standings
