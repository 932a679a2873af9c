#pragma once

#include "rankcore/core/pairing/PairingTypes.h"
#include "rankcore/core/standings/MatchTypes.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace rankcore::core::pairing {

struct SwissPairingOptions {
    std::string event_id = standings::kDefaultEventId;
    bool avoid_rematches = true;
    // Players ranked in the top N are only moved out of their score group as a last resort.
    int protect_top_n = 0;
    // Candidate attempts allowed per relaxation level.
    long long max_backtrack = 100000;
    bool allow_bye = true;
    // Downfloat counters returned by earlier rounds.
    std::map<PlayerId, int> prior_downfloats;
    std::function<void(const std::string&)> log;
};

// Search levels, tried in order until one yields a complete pairing.
enum class Relaxation {
    Strict,
    AllowRematch,
    AllowProtectedFloat
};

bool GenerateSwissPairings(const std::vector<standings::StandingRow>& current_standings,
                           const std::vector<standings::Match>& history,
                           const SwissPairingOptions& options,
                           PairingResult& result,
                           std::string* error);

}  // namespace rankcore::core::pairing
