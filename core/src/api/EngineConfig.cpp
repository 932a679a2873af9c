#include "rankcore/core/api/EngineConfig.h"

#include "rankcore/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <utility>

namespace rankcore::core::api {

namespace {

template <typename T>
void ReadOptional(const nlohmann::json& node, const char* key, std::optional<T>& out) {
    if (!node.contains(key)) {
        return;
    }
    const auto& value = node.at(key);
    if (value.is_null()) {
        out.reset();
        return;
    }
    out = value.get<T>();
}

template <typename T>
nlohmann::json WriteOptional(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

void ParseStandings(const nlohmann::json& node, StandingsConfig& out) {
    out.apply_head_to_head = node.value("apply_head_to_head", out.apply_head_to_head);
    out.opponent_pct_floor = node.value("opponent_pct_floor", out.opponent_pct_floor);
    out.accept_single_entry_matches = node.value("accept_single_entry_matches", out.accept_single_entry_matches);
    out.use_bronze_match = node.value("use_bronze_match", out.use_bronze_match);
    if (node.contains("points")) {
        const auto& points = node.at("points");
        out.points.win = points.value("win", out.points.win);
        out.points.draw = points.value("draw", out.points.draw);
        out.points.loss = points.value("loss", out.points.loss);
        out.points.bye = points.value("bye", out.points.bye);
    }
    if (node.contains("virtual_bye")) {
        const auto& virtual_bye = node.at("virtual_bye");
        out.virtual_bye.enabled = virtual_bye.value("enabled", out.virtual_bye.enabled);
        out.virtual_bye.mwp = virtual_bye.value("mwp", out.virtual_bye.mwp);
        out.virtual_bye.gwp = virtual_bye.value("gwp", out.virtual_bye.gwp);
    }
    if (node.contains("seeding")) {
        out.seeding.clear();
        for (const auto& item : node.at("seeding").items()) {
            out.seeding[item.key()] = item.value().get<int>();
        }
    }
}

void ParsePairing(const nlohmann::json& node, PairingConfig& out) {
    out.avoid_rematches = node.value("avoid_rematches", out.avoid_rematches);
    out.protect_top_n = node.value("protect_top_n", out.protect_top_n);
    out.max_backtrack = node.value("max_backtrack", out.max_backtrack);
    out.allow_bye = node.value("allow_bye", out.allow_bye);
    out.double_round_robin = node.value("double_round_robin", out.double_round_robin);
    out.shuffle_seed = node.value("shuffle_seed", out.shuffle_seed);
    out.include_bye = node.value("include_bye", out.include_bye);
    out.round = node.value("round", out.round);
}

void ParseRatings(const nlohmann::json& node, RatingsConfig& out) {
    out.mode = node.value("mode", out.mode);
    out.k = node.value("k", out.k);
    ReadOptional(node, "k_draw", out.k_draw);
    out.initial_rating = node.value("initial_rating", out.initial_rating);
    ReadOptional(node, "floor", out.floor);
    ReadOptional(node, "cap", out.cap);
    out.update_mode = node.value("update_mode", out.update_mode);
    out.draw_score = node.value("draw_score", out.draw_score);
    if (node.contains("per_player_k")) {
        out.per_player_k.clear();
        for (const auto& item : node.at("per_player_k").items()) {
            out.per_player_k[item.key()] = item.value().get<double>();
        }
    }
}

void ParseOutput(const nlohmann::json& node, OutputConfig& out) {
    out.standings_json = node.value("standings_json", out.standings_json);
    out.pairings_json = node.value("pairings_json", out.pairings_json);
    out.schedule_json = node.value("schedule_json", out.schedule_json);
    out.ratings_json = node.value("ratings_json", out.ratings_json);
    out.standings_csv = node.value("standings_csv", out.standings_csv);
}

bool ParseRoot(const nlohmann::json& root, EngineConfig& config, std::string* error) {
    if (!root.is_object()) {
        if (error) {
            *error = "Config root must be a JSON object.";
        }
        return false;
    }
    EngineConfig parsed;
    try {
        parsed.mode = root.value("mode", parsed.mode);
        parsed.event_id = root.value("event_id", parsed.event_id);
        if (root.contains("standings")) {
            ParseStandings(root.at("standings"), parsed.standings);
        }
        if (root.contains("pairing")) {
            ParsePairing(root.at("pairing"), parsed.pairing);
        }
        if (root.contains("ratings")) {
            ParseRatings(root.at("ratings"), parsed.ratings);
        }
        if (root.contains("output")) {
            ParseOutput(root.at("output"), parsed.output);
        }
    } catch (const nlohmann::json::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }
    config = std::move(parsed);
    return true;
}

nlohmann::json BuildJson(const EngineConfig& config) {
    nlohmann::json root;
    root["mode"] = config.mode;
    root["event_id"] = config.event_id;

    const auto& standings = config.standings;
    root["standings"] = {
        {"apply_head_to_head", standings.apply_head_to_head},
        {"opponent_pct_floor", standings.opponent_pct_floor},
        {"points",
         {
             {"win", standings.points.win},
             {"draw", standings.points.draw},
             {"loss", standings.points.loss},
             {"bye", standings.points.bye},
         }},
        {"accept_single_entry_matches", standings.accept_single_entry_matches},
        {"virtual_bye",
         {
             {"enabled", standings.virtual_bye.enabled},
             {"mwp", standings.virtual_bye.mwp},
             {"gwp", standings.virtual_bye.gwp},
         }},
        {"seeding", nlohmann::json(standings.seeding)},
        {"use_bronze_match", standings.use_bronze_match},
    };

    const auto& pairing = config.pairing;
    root["pairing"] = {
        {"avoid_rematches", pairing.avoid_rematches},
        {"protect_top_n", pairing.protect_top_n},
        {"max_backtrack", pairing.max_backtrack},
        {"allow_bye", pairing.allow_bye},
        {"double_round_robin", pairing.double_round_robin},
        {"shuffle_seed", pairing.shuffle_seed},
        {"include_bye", pairing.include_bye},
        {"round", pairing.round},
    };

    const auto& ratings = config.ratings;
    root["ratings"] = {
        {"mode", ratings.mode},
        {"k", ratings.k},
        {"k_draw", WriteOptional(ratings.k_draw)},
        {"per_player_k", nlohmann::json(ratings.per_player_k)},
        {"initial_rating", ratings.initial_rating},
        {"floor", WriteOptional(ratings.floor)},
        {"cap", WriteOptional(ratings.cap)},
        {"update_mode", ratings.update_mode},
        {"draw_score", ratings.draw_score},
    };

    root["output"] = {
        {"standings_json", config.output.standings_json},
        {"pairings_json", config.output.pairings_json},
        {"schedule_json", config.output.schedule_json},
        {"ratings_json", config.output.ratings_json},
        {"standings_csv", config.output.standings_csv},
    };
    return root;
}

}  // namespace

standings::SwissStandingsOptions EngineConfig::ToSwissStandingsOptions() const {
    standings::SwissStandingsOptions options;
    options.event_id = event_id;
    options.apply_head_to_head = standings.apply_head_to_head;
    options.opponent_pct_floor = standings.opponent_pct_floor;
    options.points = standings.points;
    options.accept_single_entry_matches = standings.accept_single_entry_matches;
    options.virtual_bye = standings.virtual_bye;
    return options;
}

standings::RoundRobinStandingsOptions EngineConfig::ToRoundRobinStandingsOptions() const {
    standings::RoundRobinStandingsOptions options;
    options.event_id = event_id;
    options.apply_head_to_head = standings.apply_head_to_head;
    options.opponent_pct_floor = standings.opponent_pct_floor;
    options.points = standings.points;
    options.accept_single_entry_matches = standings.accept_single_entry_matches;
    return options;
}

standings::SingleEliminationOptions EngineConfig::ToSingleEliminationOptions() const {
    standings::SingleEliminationOptions options;
    options.event_id = event_id;
    options.seeding = standings.seeding;
    options.use_bronze_match = standings.use_bronze_match;
    return options;
}

pairing::SwissPairingOptions EngineConfig::ToSwissPairingOptions() const {
    pairing::SwissPairingOptions options;
    options.event_id = event_id;
    options.avoid_rematches = pairing.avoid_rematches;
    options.protect_top_n = pairing.protect_top_n;
    options.max_backtrack = pairing.max_backtrack;
    options.allow_bye = pairing.allow_bye;
    return options;
}

pairing::RoundRobinOptions EngineConfig::ToRoundRobinOptions() const {
    pairing::RoundRobinOptions options;
    options.double_round_robin = pairing.double_round_robin;
    options.shuffle_seed = pairing.shuffle_seed;
    options.include_bye = pairing.include_bye;
    return options;
}

bool EngineConfig::ToEloOptions(ratings::EloOptions& options, std::string* error) const {
    ratings::EloOptions out;
    if (!ratings::ParseUpdateMode(ratings.update_mode, out.mode)) {
        if (error) {
            *error = "Unsupported rating update mode: " + ratings.update_mode;
        }
        return false;
    }
    out.k = ratings.k;
    out.k_draw = ratings.k_draw;
    out.per_player_k = ratings.per_player_k;
    out.initial_rating = ratings.initial_rating;
    out.floor = ratings.floor;
    out.cap = ratings.cap;
    out.draw_score = ratings.draw_score;
    options = std::move(out);
    return true;
}

bool EngineConfig::LoadFromFile(const std::string& path, EngineConfig& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    nlohmann::json root;
    try {
        input >> root;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return ParseRoot(root, config, error);
}

bool EngineConfig::LoadFromString(const std::string& text, EngineConfig& config, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return ParseRoot(root, config, error);
}

bool EngineConfig::SaveToFile(const std::string& path, const EngineConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, BuildJson(config).dump(2), error);
}

std::string EngineConfig::ToJsonString(const EngineConfig& config) {
    return BuildJson(config).dump(2);
}

}  // namespace rankcore::core::api
