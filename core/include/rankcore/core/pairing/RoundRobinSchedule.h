#pragma once

#include "rankcore/core/pairing/PairingTypes.h"

#include <string>
#include <vector>

namespace rankcore::core::pairing {

struct RoundRobinOptions {
    bool double_round_robin = false;
    // Empty keeps the caller's order.
    std::string shuffle_seed;
    bool include_bye = true;
};

struct RoundDefinition {
    int round = 1;
    std::vector<Pairing> pairings;
    std::vector<PlayerId> byes;
};

// Circle method: the first slot stays fixed, the others rotate one step per round.
bool BuildRoundRobinSchedule(const std::vector<PlayerId>& players,
                             const RoundRobinOptions& options,
                             std::vector<RoundDefinition>& rounds,
                             std::string* error);

// `round_number` is 1-based.
bool GetRoundRobinRound(const std::vector<PlayerId>& players,
                        int round_number,
                        const RoundRobinOptions& options,
                        RoundDefinition& round,
                        std::string* error);

}  // namespace rankcore::core::pairing
