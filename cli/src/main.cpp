#include "rankcore/core/api/EngineConfig.h"
#include "rankcore/core/api/JsonCodec.h"
#include "rankcore/core/export/StandingsExport.h"
#include "rankcore/core/pairing/PairingService.h"
#include "rankcore/core/pairing/RoundRobinSchedule.h"
#include "rankcore/core/ratings/Elo.h"
#include "rankcore/core/standings/StandingsEngine.h"
#include "rankcore/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {

using rankcore::core::api::EngineConfig;

constexpr const char* kUsage =
    "Usage: rankcorecli <standings|pairings|schedule|round|ratings> <config.json> <input.json> [output.json]";

struct CommandContext {
    EngineConfig config;
    nlohmann::json input;
    std::string output_path;
};

void LogLine(const std::string& line) {
    std::cout << "[rankcorecli] " << line << '\n';
}

bool WriteOutput(const std::string& path, const nlohmann::json& document, std::string* error) {
    if (!rankcore::core::util::AtomicFileWriter::Write(path, document.dump(2), error)) {
        return false;
    }
    LogLine("Wrote " + path);
    return true;
}

const nlohmann::json& Field(const nlohmann::json& input, const char* key) {
    static const nlohmann::json kNull;
    if (input.is_object() && input.contains(key)) {
        return input.at(key);
    }
    return kNull;
}

// Accepts {"matches": [...]} or a bare array of match records.
bool ReadMatches(const nlohmann::json& input,
                 const char* key,
                 std::vector<rankcore::core::standings::Match>& matches,
                 std::string* error) {
    if (input.is_array()) {
        return rankcore::core::api::MatchesFromJson(input, matches, error);
    }
    const auto& node = Field(input, key);
    if (node.is_null()) {
        matches.clear();
        return true;
    }
    return rankcore::core::api::MatchesFromJson(node, matches, error);
}

bool ComputeStandingsFor(const EngineConfig& config,
                         const std::vector<rankcore::core::standings::Match>& matches,
                         std::vector<rankcore::core::standings::StandingRow>& rows,
                         std::string* error) {
    rankcore::core::standings::StandingsRequest request;
    request.mode = config.mode;
    request.matches = matches;
    request.swiss = config.ToSwissStandingsOptions();
    request.round_robin = config.ToRoundRobinStandingsOptions();
    request.single_elimination = config.ToSingleEliminationOptions();
    return rankcore::core::standings::ComputeStandings(request, rows, error);
}

int RunStandings(const CommandContext& context) {
    std::string error;
    std::vector<rankcore::core::standings::Match> matches;
    if (!ReadMatches(context.input, "matches", matches, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }

    std::vector<rankcore::core::standings::StandingRow> rows;
    if (!ComputeStandingsFor(context.config, matches, rows, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    LogLine("Standings (" + context.config.mode + "): " + std::to_string(rows.size()) + " competitors from " +
            std::to_string(matches.size()) + " records.");
    const size_t shown = std::min<size_t>(rows.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
        std::cout << "[rankcorecli]   " << rows[i].rank << ". " << rows[i].player_id << " " << rows[i].match_points
                  << '\n';
    }

    nlohmann::json document;
    document["mode"] = context.config.mode;
    document["event_id"] = context.config.event_id;
    document["standings"] = rankcore::core::api::StandingsToJson(rows);
    if (!WriteOutput(context.output_path, document, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    if (!context.config.output.standings_csv.empty()) {
        if (!rankcore::core::exporter::WriteStandingsCsv(context.config.output.standings_csv, rows, &error)) {
            std::cerr << "[rankcorecli] " << error << '\n';
            return 1;
        }
        LogLine("Wrote " + context.config.output.standings_csv);
    }
    return 0;
}

int RunPairings(const CommandContext& context) {
    std::string error;
    rankcore::core::pairing::PairingRequest request;
    request.mode = context.config.mode;
    request.swiss = context.config.ToSwissPairingOptions();
    request.swiss.log = LogLine;
    request.round_robin = context.config.ToRoundRobinOptions();
    request.round_number = Field(context.input, "round").is_null() ? context.config.pairing.round
                                                                   : Field(context.input, "round").get<int>();

    if (request.mode == "roundrobin") {
        if (!rankcore::core::api::PlayersFromJson(Field(context.input, "players"), request.players, &error)) {
            std::cerr << "[rankcorecli] " << error << '\n';
            return 1;
        }
    } else {
        if (!ReadMatches(context.input, "history", request.history, &error)) {
            std::cerr << "[rankcorecli] " << error << '\n';
            return 1;
        }
        const auto& standings_node = Field(context.input, "standings");
        if (standings_node.is_null()) {
            LogLine("No standings supplied; computing them from history.");
            if (!ComputeStandingsFor(context.config, request.history, request.standings, &error)) {
                std::cerr << "[rankcorecli] " << error << '\n';
                return 1;
            }
        } else if (!rankcore::core::api::StandingsFromJson(standings_node, request.standings, &error)) {
            std::cerr << "[rankcorecli] " << error << '\n';
            return 1;
        }
        const auto& downfloats = Field(context.input, "prior_downfloats");
        if (downfloats.is_object()) {
            for (const auto& item : downfloats.items()) {
                request.swiss.prior_downfloats[item.key()] = item.value().get<int>();
            }
        }
    }

    rankcore::core::pairing::PairingResult result;
    if (!rankcore::core::pairing::GeneratePairings(request, result, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    LogLine("Pairings (" + request.mode + "): " + std::to_string(result.pairings.size()) + " boards" +
            (result.bye ? ", bye " + *result.bye : std::string()) +
            (result.rematches_used.empty() ? std::string()
                                           : ", " + std::to_string(result.rematches_used.size()) + " rematches"));
    for (const auto& pair : result.pairings) {
        std::cout << "[rankcorecli]   " << pair.a << " - " << pair.b << '\n';
    }

    if (!WriteOutput(context.output_path, rankcore::core::api::PairingResultToJson(result), &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    return 0;
}

int RunSchedule(const CommandContext& context) {
    std::string error;
    std::vector<std::string> players;
    if (!rankcore::core::api::PlayersFromJson(Field(context.input, "players"), players, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    std::vector<rankcore::core::pairing::RoundDefinition> rounds;
    if (!rankcore::core::pairing::BuildRoundRobinSchedule(players, context.config.ToRoundRobinOptions(), rounds,
                                                          &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    LogLine("Schedule: " + std::to_string(players.size()) + " players, " + std::to_string(rounds.size()) +
            " rounds.");

    nlohmann::json document;
    document["rounds"] = rankcore::core::api::ScheduleToJson(rounds);
    if (!WriteOutput(context.output_path, document, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    return 0;
}

int RunRound(const CommandContext& context) {
    std::string error;
    std::vector<std::string> players;
    if (!rankcore::core::api::PlayersFromJson(Field(context.input, "players"), players, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    const int round_number = Field(context.input, "round").is_null() ? context.config.pairing.round
                                                                     : Field(context.input, "round").get<int>();
    rankcore::core::pairing::RoundDefinition round;
    if (!rankcore::core::pairing::GetRoundRobinRound(players, round_number, context.config.ToRoundRobinOptions(),
                                                     round, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    LogLine("Round " + std::to_string(round.round) + ": " + std::to_string(round.pairings.size()) + " pairings.");

    if (!WriteOutput(context.output_path, rankcore::core::api::RoundToJson(round), &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    return 0;
}

int RunRatings(const CommandContext& context) {
    std::string error;
    rankcore::core::ratings::RatingsRequest request;
    request.mode = context.config.ratings.mode;
    if (!context.config.ToEloOptions(request.elo, &error) ||
        !rankcore::core::api::RatingMapFromJson(Field(context.input, "base"), request.base, &error) ||
        !rankcore::core::api::EloMatchesFromJson(Field(context.input, "matches"), request.matches, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }

    rankcore::core::ratings::EloUpdateResult result;
    if (!rankcore::core::ratings::UpdateRatings(request, result, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    LogLine("Ratings: " + std::to_string(request.matches.size()) + " matches, " +
            std::to_string(result.ratings.size()) + " players.");

    if (!WriteOutput(context.output_path, rankcore::core::api::EloResultToJson(result), &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    return 0;
}

std::string DefaultOutputPath(const std::string& command, const EngineConfig& config) {
    if (command == "standings") {
        return config.output.standings_json;
    }
    if (command == "pairings") {
        return config.output.pairings_json;
    }
    if (command == "schedule" || command == "round") {
        return config.output.schedule_json;
    }
    return config.output.ratings_json;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << kUsage << '\n';
        return 1;
    }

    const std::string command = argv[1];
    const std::string config_path = argv[2];
    const std::string input_path = argv[3];

    int (*runner)(const CommandContext&) = nullptr;
    if (command == "standings") {
        runner = RunStandings;
    } else if (command == "pairings") {
        runner = RunPairings;
    } else if (command == "schedule") {
        runner = RunSchedule;
    } else if (command == "round") {
        runner = RunRound;
    } else if (command == "ratings") {
        runner = RunRatings;
    } else {
        std::cerr << "[rankcorecli] Unknown command: " << command << '\n';
        std::cerr << kUsage << '\n';
        return 1;
    }

    std::cout << "[rankcorecli] Engine config: " << config_path << '\n';

    CommandContext context;
    std::string error;
    if (!EngineConfig::LoadFromFile(config_path, context.config, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    if (!rankcore::core::api::LoadJsonFile(input_path, context.input, &error)) {
        std::cerr << "[rankcorecli] " << error << '\n';
        return 1;
    }
    context.output_path = argc > 4 ? argv[4] : DefaultOutputPath(command, context.config);

    try {
        return runner(context);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[rankcorecli] Invalid input: " << ex.what() << '\n';
        return 1;
    }
}
