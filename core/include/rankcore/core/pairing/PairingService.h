#pragma once

#include "rankcore/core/pairing/PairingTypes.h"
#include "rankcore/core/pairing/RoundRobinSchedule.h"
#include "rankcore/core/pairing/SwissPairing.h"

#include <memory>
#include <string>
#include <vector>

namespace rankcore::core::pairing {

struct PairingRequest {
    std::string mode = "swiss";
    // Swiss.
    std::vector<StandingRow> standings;
    std::vector<Match> history;
    SwissPairingOptions swiss;
    // Round robin.
    std::vector<PlayerId> players;
    int round_number = 1;
    RoundRobinOptions round_robin;
};

class IPairingStrategy {
public:
    virtual ~IPairingStrategy() = default;
    virtual bool BuildRound(const PairingRequest& request, PairingResult& result, std::string* error) = 0;
};

class SwissPairingStrategy final : public IPairingStrategy {
public:
    bool BuildRound(const PairingRequest& request, PairingResult& result, std::string* error) override;
};

class RoundRobinPairingStrategy final : public IPairingStrategy {
public:
    bool BuildRound(const PairingRequest& request, PairingResult& result, std::string* error) override;
};

// Null for an unknown mode.
std::unique_ptr<IPairingStrategy> MakePairingStrategy(const std::string& mode);

bool GeneratePairings(const PairingRequest& request, PairingResult& result, std::string* error);

}  // namespace rankcore::core::pairing
