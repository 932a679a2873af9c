#pragma once

#include "rankcore/core/pairing/RoundRobinSchedule.h"
#include "rankcore/core/pairing/SwissPairing.h"
#include "rankcore/core/ratings/Elo.h"
#include "rankcore/core/standings/MatchTypes.h"

#include <map>
#include <optional>
#include <string>

namespace rankcore::core::api {

struct StandingsConfig {
    bool apply_head_to_head = true;
    double opponent_pct_floor = standings::kDefaultOpponentPctFloor;
    standings::PointsMap points;
    bool accept_single_entry_matches = false;
    standings::VirtualByeConfig virtual_bye;
    std::map<std::string, int> seeding;
    bool use_bronze_match = true;
};

struct PairingConfig {
    bool avoid_rematches = true;
    int protect_top_n = 0;
    long long max_backtrack = 100000;
    bool allow_bye = true;
    bool double_round_robin = false;
    std::string shuffle_seed;
    bool include_bye = true;
    int round = 1;
};

struct RatingsConfig {
    std::string mode = "elo";
    double k = 32.0;
    std::optional<double> k_draw;
    std::map<std::string, double> per_player_k;
    double initial_rating = ratings::kDefaultRating;
    std::optional<double> floor;
    std::optional<double> cap;
    std::string update_mode = "sequential";
    double draw_score = 0.5;
};

struct OutputConfig {
    std::string standings_json = "out/standings.json";
    std::string pairings_json = "out/pairings.json";
    std::string schedule_json = "out/schedule.json";
    std::string ratings_json = "out/ratings.json";
    // Empty disables the CSV copy of the standings.
    std::string standings_csv;
};

struct EngineConfig {
    // "swiss", "roundrobin" or "singleelimination".
    std::string mode = "swiss";
    std::string event_id = standings::kDefaultEventId;
    StandingsConfig standings;
    PairingConfig pairing;
    RatingsConfig ratings;
    OutputConfig output;

    standings::SwissStandingsOptions ToSwissStandingsOptions() const;
    standings::RoundRobinStandingsOptions ToRoundRobinStandingsOptions() const;
    standings::SingleEliminationOptions ToSingleEliminationOptions() const;
    pairing::SwissPairingOptions ToSwissPairingOptions() const;
    pairing::RoundRobinOptions ToRoundRobinOptions() const;
    bool ToEloOptions(ratings::EloOptions& options, std::string* error) const;

    static bool LoadFromFile(const std::string& path, EngineConfig& config, std::string* error);
    static bool LoadFromString(const std::string& text, EngineConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const EngineConfig& config, std::string* error);
    static std::string ToJsonString(const EngineConfig& config);
};

}  // namespace rankcore::core::api
