#pragma once

#include "rankcore/core/pairing/PairingTypes.h"
#include "rankcore/core/pairing/RoundRobinSchedule.h"
#include "rankcore/core/ratings/Elo.h"
#include "rankcore/core/standings/MatchTypes.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace rankcore::core::api {

bool LoadJsonFile(const std::string& path, nlohmann::json& root, std::string* error);

// Array of match records. A missing or null "opponent_id" marks a bye.
bool MatchesFromJson(const nlohmann::json& node, std::vector<standings::Match>& matches, std::string* error);
nlohmann::json MatchesToJson(const std::vector<standings::Match>& matches);

bool StandingsFromJson(const nlohmann::json& node,
                       std::vector<standings::StandingRow>& rows,
                       std::string* error);
nlohmann::json StandingsToJson(const std::vector<standings::StandingRow>& rows);

bool PlayersFromJson(const nlohmann::json& node, std::vector<standings::PlayerId>& players, std::string* error);

nlohmann::json PairingResultToJson(const pairing::PairingResult& result);
nlohmann::json RoundToJson(const pairing::RoundDefinition& round);
nlohmann::json ScheduleToJson(const std::vector<pairing::RoundDefinition>& rounds);

bool RatingMapFromJson(const nlohmann::json& node, ratings::RatingMap& out, std::string* error);
bool EloMatchesFromJson(const nlohmann::json& node, std::vector<ratings::EloMatch>& matches, std::string* error);
nlohmann::json EloResultToJson(const ratings::EloUpdateResult& result);

}  // namespace rankcore::core::api
