#include "rankcore/core/pairing/RoundRobinSchedule.h"

#include "rankcore/core/util/DeterministicHash.h"

#include <sstream>

namespace rankcore::core::pairing {

namespace {

constexpr int kByeSlot = -1;

std::vector<int> BuildTeamList(int player_count) {
    std::vector<int> teams;
    teams.reserve(static_cast<size_t>(player_count + 1));
    for (int i = 0; i < player_count; ++i) {
        teams.push_back(i);
    }
    if (player_count % 2 == 1) {
        teams.push_back(kByeSlot);
    }
    return teams;
}

void RotateTeams(std::vector<int>& teams) {
    if (teams.size() <= 2) {
        return;
    }
    const int last = teams.back();
    for (size_t i = teams.size() - 1; i > 1; --i) {
        teams[i] = teams[i - 1];
    }
    teams[1] = last;
}

}  // namespace

bool BuildRoundRobinSchedule(const std::vector<PlayerId>& players,
                             const RoundRobinOptions& options,
                             std::vector<RoundDefinition>& rounds,
                             std::string* error) {
    if (players.size() < 2) {
        RoundDefinition single;
        single.round = 1;
        if (players.size() == 1) {
            single.byes.push_back(players.front());
        }
        rounds = {single};
        return true;
    }

    std::vector<PlayerId> order = players;
    if (!options.shuffle_seed.empty()) {
        util::DeterministicShuffle(order, options.shuffle_seed);
    }

    const int player_count = static_cast<int>(order.size());
    if (player_count % 2 == 1 && !options.include_bye) {
        if (error) {
            std::ostringstream out;
            out << "Round robin for an odd number of players (" << player_count
                << ") requires include_bye.";
            *error = out.str();
        }
        return false;
    }

    auto teams = BuildTeamList(player_count);
    const int team_count = static_cast<int>(teams.size());
    const int round_count = team_count - 1;

    std::vector<RoundDefinition> schedule;
    schedule.reserve(static_cast<size_t>(options.double_round_robin ? 2 * round_count : round_count));

    for (int round = 1; round <= round_count; ++round) {
        RoundDefinition definition;
        definition.round = round;
        for (int i = 0; i < team_count / 2; ++i) {
            const int t1 = teams[static_cast<size_t>(i)];
            const int t2 = teams[static_cast<size_t>(team_count - 1 - i)];
            if (t1 == kByeSlot || t2 == kByeSlot) {
                definition.byes.push_back(order[static_cast<size_t>(t1 == kByeSlot ? t2 : t1)]);
                continue;
            }
            definition.pairings.push_back({order[static_cast<size_t>(t1)], order[static_cast<size_t>(t2)]});
        }
        schedule.push_back(std::move(definition));
        RotateTeams(teams);
    }

    if (options.double_round_robin) {
        for (int round = 0; round < round_count; ++round) {
            const RoundDefinition first_leg = schedule[static_cast<size_t>(round)];
            RoundDefinition second_leg;
            second_leg.round = round_count + first_leg.round;
            second_leg.byes = first_leg.byes;
            for (const auto& pairing : first_leg.pairings) {
                second_leg.pairings.push_back({pairing.b, pairing.a});
            }
            schedule.push_back(std::move(second_leg));
        }
    }

    rounds = std::move(schedule);
    return true;
}

bool GetRoundRobinRound(const std::vector<PlayerId>& players,
                        int round_number,
                        const RoundRobinOptions& options,
                        RoundDefinition& round,
                        std::string* error) {
    std::vector<RoundDefinition> rounds;
    if (!BuildRoundRobinSchedule(players, options, rounds, error)) {
        return false;
    }
    if (round_number < 1 || round_number > static_cast<int>(rounds.size())) {
        if (error) {
            std::ostringstream out;
            out << "Round " << round_number << " out of range (1.." << rounds.size() << ").";
            *error = out.str();
        }
        return false;
    }
    round = rounds[static_cast<size_t>(round_number - 1)];
    return true;
}

}  // namespace rankcore::core::pairing
