#pragma once

#include "rankcore/core/standings/MatchIndex.h"
#include "rankcore/core/standings/MatchTypes.h"

#include <string>
#include <vector>

namespace rankcore::core::standings {

bool ComputeSwissStandings(const std::vector<Match>& matches,
                           const SwissStandingsOptions& options,
                           std::vector<StandingRow>& standings,
                           std::string* error);

// Fails on a pairing recorded from one side only unless accept_single_entry_matches is set.
bool ComputeRoundRobinStandings(const std::vector<Match>& matches,
                                const RoundRobinStandingsOptions& options,
                                std::vector<StandingRow>& standings,
                                std::string* error);

std::vector<StandingRow> ComputeSingleEliminationStandings(const std::vector<Match>& matches,
                                                           const SingleEliminationOptions& options);

struct StandingsRequest {
    std::string mode = "swiss";
    std::vector<Match> matches;
    SwissStandingsOptions swiss;
    RoundRobinStandingsOptions round_robin;
    SingleEliminationOptions single_elimination;
};

bool ComputeStandings(const StandingsRequest& request,
                      std::vector<StandingRow>& standings,
                      std::string* error);

}  // namespace rankcore::core::standings
