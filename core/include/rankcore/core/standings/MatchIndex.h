#pragma once

#include "rankcore/core/standings/MatchTypes.h"

#include <map>
#include <vector>

namespace rankcore::core::standings {

using MatchesByPlayer = std::map<PlayerId, std::vector<Match>>;

// Groups records by owner, each list ordered by (round, id).
MatchesByPlayer GroupByPlayer(const std::vector<Match>& matches);

// Real records (A vs B, round r) with no (B vs A, round r) counterpart.
std::vector<Match> FindMissingMirrors(const std::vector<Match>& matches);

// Penalties given to a reconstructed mirror record.
enum class MirrorPenalties {
    Zero,
    CopyFromEntry
};

// Returns `matches` plus one reconstructed mirror for every missing counterpart.
std::vector<Match> MirrorSingleEntryMatches(const std::vector<Match>& matches,
                                            MirrorPenalties penalties = MirrorPenalties::Zero);

// First record whose opponent is its owner, if any.
const Match* FindSelfPairing(const std::vector<Match>& matches);

}  // namespace rankcore::core::standings
