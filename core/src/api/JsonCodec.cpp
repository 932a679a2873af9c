#include "rankcore/core/api/JsonCodec.h"

#include <fstream>
#include <utility>

namespace rankcore::core::api {

namespace {

bool Fail(const std::string& message, std::string* error) {
    if (error) {
        *error = message;
    }
    return false;
}

bool ReadCount(const nlohmann::json& node, const char* key, int& out, const std::string& where, std::string* error) {
    out = node.value(key, 0);
    if (out < 0) {
        return Fail(where + ": " + key + " must not be negative.", error);
    }
    return true;
}

bool ParseMatch(const nlohmann::json& node, size_t index, standings::Match& out, std::string* error) {
    const std::string where = "matches[" + std::to_string(index) + "]";
    if (!node.is_object()) {
        return Fail(where + " must be an object.", error);
    }
    if (!node.contains("player_id")) {
        return Fail(where + " is missing player_id.", error);
    }
    standings::Match match;
    match.id = node.value("id", std::to_string(index));
    match.round = node.value("round", 1);
    if (match.round < 1) {
        return Fail(where + ": round must be positive.", error);
    }
    match.player_id = node.at("player_id").get<std::string>();
    if (node.contains("opponent_id") && !node.at("opponent_id").is_null()) {
        match.opponent_id = node.at("opponent_id").get<std::string>();
    }
    const std::string result = node.value("result", std::string());
    if (!standings::ParseResult(result, match.result)) {
        return Fail(where + ": unknown result '" + result + "'.", error);
    }
    if (!ReadCount(node, "game_wins", match.game_wins, where, error) ||
        !ReadCount(node, "game_losses", match.game_losses, where, error) ||
        !ReadCount(node, "game_draws", match.game_draws, where, error) ||
        !ReadCount(node, "penalties", match.penalties, where, error)) {
        return false;
    }
    out = std::move(match);
    return true;
}

nlohmann::json PairingsToJson(const std::vector<pairing::Pairing>& pairings) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& pair : pairings) {
        out.push_back({{"a", pair.a}, {"b", pair.b}});
    }
    return out;
}

}  // namespace

bool LoadJsonFile(const std::string& path, nlohmann::json& root, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        return Fail("Failed to open input: " + path, error);
    }
    try {
        input >> root;
    } catch (const std::exception& ex) {
        return Fail(std::string("Failed to parse JSON: ") + ex.what(), error);
    }
    return true;
}

bool MatchesFromJson(const nlohmann::json& node, std::vector<standings::Match>& matches, std::string* error) {
    if (!node.is_array()) {
        return Fail("matches must be an array.", error);
    }
    std::vector<standings::Match> parsed;
    parsed.reserve(node.size());
    try {
        for (size_t i = 0; i < node.size(); ++i) {
            standings::Match match;
            if (!ParseMatch(node.at(i), i, match, error)) {
                return false;
            }
            parsed.push_back(std::move(match));
        }
    } catch (const nlohmann::json::exception& ex) {
        return Fail(std::string("Invalid match record: ") + ex.what(), error);
    }
    matches = std::move(parsed);
    return true;
}

nlohmann::json MatchesToJson(const std::vector<standings::Match>& matches) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& match : matches) {
        nlohmann::json node;
        node["id"] = match.id;
        node["round"] = match.round;
        node["player_id"] = match.player_id;
        node["opponent_id"] = match.opponent_id ? nlohmann::json(*match.opponent_id) : nlohmann::json(nullptr);
        node["result"] = standings::ResultToString(match.result);
        node["game_wins"] = match.game_wins;
        node["game_losses"] = match.game_losses;
        node["game_draws"] = match.game_draws;
        node["penalties"] = match.penalties;
        out.push_back(std::move(node));
    }
    return out;
}

bool StandingsFromJson(const nlohmann::json& node,
                       std::vector<standings::StandingRow>& out,
                       std::string* error) {
    if (!node.is_array()) {
        return Fail("standings must be an array.", error);
    }
    std::vector<standings::StandingRow> rows;
    try {
        for (size_t i = 0; i < node.size(); ++i) {
            const auto& item = node.at(i);
            if (!item.is_object() || !item.contains("player_id")) {
                return Fail("standings[" + std::to_string(i) + "] is missing player_id.", error);
            }
            standings::StandingRow row;
            row.rank = item.value("rank", static_cast<int>(i) + 1);
            row.player_id = item.at("player_id").get<std::string>();
            row.match_points = item.value("match_points", 0.0);
            row.mwp = item.value("mwp", 0.0);
            row.omwp = item.value("omwp", 0.0);
            row.gwp = item.value("gwp", 0.0);
            row.ogwp = item.value("ogwp", 0.0);
            row.sb = item.value("sb", 0.0);
            row.wins = item.value("wins", 0);
            row.losses = item.value("losses", 0);
            row.draws = item.value("draws", 0);
            row.byes = item.value("byes", 0);
            row.rounds_played = item.value("rounds_played", 0);
            row.game_wins = item.value("game_wins", 0);
            row.game_losses = item.value("game_losses", 0);
            row.game_draws = item.value("game_draws", 0);
            row.penalties = item.value("penalties", 0);
            row.elim_round = item.value("elim_round", 0);
            if (item.contains("opponents")) {
                row.opponents = item.at("opponents").get<std::vector<std::string>>();
            }
            rows.push_back(std::move(row));
        }
    } catch (const nlohmann::json::exception& ex) {
        return Fail(std::string("Invalid standings row: ") + ex.what(), error);
    }
    out = std::move(rows);
    return true;
}

nlohmann::json StandingsToJson(const std::vector<standings::StandingRow>& rows) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json node = {
            {"rank", row.rank},
            {"player_id", row.player_id},
            {"match_points", row.match_points},
            {"mwp", row.mwp},
            {"omwp", row.omwp},
            {"gwp", row.gwp},
            {"ogwp", row.ogwp},
            {"sb", row.sb},
            {"wins", row.wins},
            {"losses", row.losses},
            {"draws", row.draws},
            {"byes", row.byes},
            {"rounds_played", row.rounds_played},
            {"game_wins", row.game_wins},
            {"game_losses", row.game_losses},
            {"game_draws", row.game_draws},
            {"penalties", row.penalties},
            {"opponents", row.opponents},
        };
        if (row.elim_round > 0) {
            node["elim_round"] = row.elim_round;
        }
        out.push_back(std::move(node));
    }
    return out;
}

bool PlayersFromJson(const nlohmann::json& node, std::vector<standings::PlayerId>& players, std::string* error) {
    if (!node.is_array()) {
        return Fail("players must be an array.", error);
    }
    try {
        players = node.get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& ex) {
        return Fail(std::string("Invalid player list: ") + ex.what(), error);
    }
    return true;
}

nlohmann::json PairingResultToJson(const pairing::PairingResult& result) {
    nlohmann::json out;
    out["pairings"] = PairingsToJson(result.pairings);
    out["bye"] = result.bye ? nlohmann::json(*result.bye) : nlohmann::json(nullptr);
    out["downfloats"] = nlohmann::json(result.downfloats);
    out["rematches_used"] = PairingsToJson(result.rematches_used);
    if (result.round > 0) {
        out["round"] = result.round;
        out["byes"] = result.byes;
    }
    return out;
}

nlohmann::json RoundToJson(const pairing::RoundDefinition& round) {
    return {
        {"round", round.round},
        {"pairings", PairingsToJson(round.pairings)},
        {"byes", round.byes},
    };
}

nlohmann::json ScheduleToJson(const std::vector<pairing::RoundDefinition>& rounds) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& round : rounds) {
        out.push_back(RoundToJson(round));
    }
    return out;
}

bool RatingMapFromJson(const nlohmann::json& node, ratings::RatingMap& out, std::string* error) {
    if (node.is_null()) {
        out.clear();
        return true;
    }
    if (!node.is_object()) {
        return Fail("base ratings must be an object.", error);
    }
    ratings::RatingMap parsed;
    try {
        for (const auto& item : node.items()) {
            parsed[item.key()] = item.value().get<double>();
        }
    } catch (const nlohmann::json::exception& ex) {
        return Fail(std::string("Invalid rating value: ") + ex.what(), error);
    }
    out = std::move(parsed);
    return true;
}

bool EloMatchesFromJson(const nlohmann::json& node, std::vector<ratings::EloMatch>& matches, std::string* error) {
    if (!node.is_array()) {
        return Fail("rating matches must be an array.", error);
    }
    std::vector<ratings::EloMatch> parsed;
    try {
        for (size_t i = 0; i < node.size(); ++i) {
            const auto& item = node.at(i);
            const std::string where = "matches[" + std::to_string(i) + "]";
            if (!item.is_object() || !item.contains("a") || !item.contains("b")) {
                return Fail(where + " needs both a and b.", error);
            }
            ratings::EloMatch match;
            match.a = item.at("a").get<std::string>();
            match.b = item.at("b").get<std::string>();
            const std::string result = item.value("result", std::string());
            if (!ratings::ParseOutcome(result, match.result)) {
                return Fail(where + ": unknown result '" + result + "'.", error);
            }
            match.weight = item.value("weight", 1.0);
            parsed.push_back(std::move(match));
        }
    } catch (const nlohmann::json::exception& ex) {
        return Fail(std::string("Invalid rating match: ") + ex.what(), error);
    }
    matches = std::move(parsed);
    return true;
}

nlohmann::json EloResultToJson(const ratings::EloUpdateResult& result) {
    return {
        {"mode", "elo"},
        {"ratings", nlohmann::json(result.ratings)},
        {"deltas", nlohmann::json(result.deltas)},
    };
}

}  // namespace rankcore::core::api
