#include "rankcore/core/pairing/PairingService.h"

namespace rankcore::core::pairing {

bool SwissPairingStrategy::BuildRound(const PairingRequest& request, PairingResult& result, std::string* error) {
    return GenerateSwissPairings(request.standings, request.history, request.swiss, result, error);
}

bool RoundRobinPairingStrategy::BuildRound(const PairingRequest& request,
                                           PairingResult& result,
                                           std::string* error) {
    RoundDefinition round;
    if (!GetRoundRobinRound(request.players, request.round_number, request.round_robin, round, error)) {
        return false;
    }
    PairingResult out;
    out.pairings = std::move(round.pairings);
    out.round = round.round;
    out.byes = std::move(round.byes);
    if (!out.byes.empty()) {
        out.bye = out.byes.front();
    }
    result = std::move(out);
    return true;
}

std::unique_ptr<IPairingStrategy> MakePairingStrategy(const std::string& mode) {
    if (mode == "swiss") {
        return std::make_unique<SwissPairingStrategy>();
    }
    if (mode == "roundrobin") {
        return std::make_unique<RoundRobinPairingStrategy>();
    }
    return nullptr;
}

bool GeneratePairings(const PairingRequest& request, PairingResult& result, std::string* error) {
    auto strategy = MakePairingStrategy(request.mode);
    if (!strategy) {
        if (error) {
            *error = "Unsupported pairing mode: " + request.mode;
        }
        return false;
    }
    return strategy->BuildRound(request, result, error);
}

}  // namespace rankcore::core::pairing
