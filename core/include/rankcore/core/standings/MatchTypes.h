#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rankcore::core::standings {

using PlayerId = std::string;

enum class MatchResult {
    Win,
    Loss,
    Draw,
    Bye,
    ForfeitWin,
    ForfeitLoss
};

// One directed record: the result is seen from `player_id`'s side.
struct Match {
    std::string id;
    int round = 1;
    PlayerId player_id;
    std::optional<PlayerId> opponent_id;
    MatchResult result = MatchResult::Loss;
    int game_wins = 0;
    int game_losses = 0;
    int game_draws = 0;
    int penalties = 0;

    bool is_bye() const { return !opponent_id.has_value(); }
};

struct StandingRow {
    int rank = 0;
    PlayerId player_id;
    double match_points = 0.0;
    double mwp = 0.0;
    double omwp = 0.0;
    double gwp = 0.0;
    double ogwp = 0.0;
    double sb = 0.0;
    int wins = 0;
    int losses = 0;
    int draws = 0;
    int byes = 0;
    int rounds_played = 0;
    int game_wins = 0;
    int game_losses = 0;
    int game_draws = 0;
    int penalties = 0;
    std::vector<PlayerId> opponents;
    // Single elimination only.
    int elim_round = 0;
};

struct PointsMap {
    double win = 3.0;
    double draw = 1.0;
    double loss = 0.0;
    double bye = 3.0;
};

struct VirtualByeConfig {
    bool enabled = false;
    double mwp = 0.5;
    double gwp = 0.5;
};

constexpr double kDefaultOpponentPctFloor = 0.33;
constexpr const char* kDefaultEventId = "rankings-core";

struct SwissStandingsOptions {
    std::string event_id = kDefaultEventId;
    bool apply_head_to_head = true;
    double opponent_pct_floor = kDefaultOpponentPctFloor;
    PointsMap points;
    bool accept_single_entry_matches = false;
    VirtualByeConfig virtual_bye;
};

struct RoundRobinStandingsOptions {
    std::string event_id = kDefaultEventId;
    bool apply_head_to_head = true;
    double opponent_pct_floor = kDefaultOpponentPctFloor;
    PointsMap points;
    bool accept_single_entry_matches = false;
};

struct SingleEliminationOptions {
    std::string event_id = kDefaultEventId;
    std::map<PlayerId, int> seeding;
    // Accepted for configuration compatibility; it does not change the order.
    bool use_bronze_match = true;
};

bool IsWinResult(MatchResult result);
bool IsLossResult(MatchResult result);
MatchResult FlipResult(MatchResult result);
std::string ResultToString(MatchResult result);
bool ParseResult(const std::string& value, MatchResult& result);

}  // namespace rankcore::core::standings
