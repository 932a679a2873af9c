#pragma once

#include "rankcore/core/standings/MatchTypes.h"

#include <map>
#include <optional>
#include <vector>

namespace rankcore::core::pairing {

using standings::Match;
using standings::PlayerId;
using standings::StandingRow;

struct Pairing {
    PlayerId a;
    PlayerId b;

    bool operator==(const Pairing& other) const { return a == other.a && b == other.b; }
};

struct PairingResult {
    std::vector<Pairing> pairings;
    std::optional<PlayerId> bye;
    // Swiss only.
    std::map<PlayerId, int> downfloats;
    std::vector<Pairing> rematches_used;
    // Round robin only.
    int round = 0;
    std::vector<PlayerId> byes;
};

}  // namespace rankcore::core::pairing
