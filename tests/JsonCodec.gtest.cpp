#include <gtest/gtest.h>

#include "rankcore/core/api/JsonCodec.h"

#include <string>
#include <vector>

namespace rankcore::core::api {

using standings::Match;
using standings::MatchResult;
using standings::StandingRow;

TEST(JsonCodecTest, ParsesMatchRecords) {
    const auto node = nlohmann::json::parse(R"([
        {"id": "r1-1", "round": 1, "player_id": "A", "opponent_id": "B", "result": "W",
         "game_wins": 2, "game_losses": 1},
        {"player_id": "C", "opponent_id": null, "result": "bye", "round": 1},
        {"player_id": "D", "result": "forfeit-win", "round": 2, "opponent_id": "E", "penalties": 1}
    ])");
    std::vector<Match> matches;
    std::string error;
    ASSERT_TRUE(MatchesFromJson(node, matches, &error)) << error;
    ASSERT_EQ(matches.size(), 3u);

    EXPECT_EQ(matches[0].id, "r1-1");
    EXPECT_EQ(matches[0].result, MatchResult::Win);
    EXPECT_EQ(matches[0].game_wins, 2);
    EXPECT_EQ(matches[0].game_losses, 1);

    EXPECT_TRUE(matches[1].is_bye());
    EXPECT_EQ(matches[1].id, "1");
    EXPECT_EQ(matches[1].result, MatchResult::Bye);

    EXPECT_EQ(matches[2].result, MatchResult::ForfeitWin);
    EXPECT_EQ(matches[2].round, 2);
    EXPECT_EQ(matches[2].penalties, 1);
}

TEST(JsonCodecTest, RejectsBadMatchRecords) {
    std::vector<Match> matches;
    std::string error;

    EXPECT_FALSE(MatchesFromJson(nlohmann::json::object(), matches, &error));
    EXPECT_EQ(error, "matches must be an array.");

    EXPECT_FALSE(MatchesFromJson(nlohmann::json::parse(R"([{"opponent_id": "B", "result": "W"}])"), matches, &error));
    EXPECT_EQ(error, "matches[0] is missing player_id.");

    EXPECT_FALSE(
        MatchesFromJson(nlohmann::json::parse(R"([{"player_id": "A", "opponent_id": "B", "result": "X"}])"), matches,
                        &error));
    EXPECT_EQ(error, "matches[0]: unknown result 'X'.");

    EXPECT_FALSE(MatchesFromJson(
        nlohmann::json::parse(R"([{"player_id": "A", "opponent_id": "B", "result": "L", "game_wins": -1}])"), matches,
        &error));
    EXPECT_EQ(error, "matches[0]: game_wins must not be negative.");

    EXPECT_FALSE(MatchesFromJson(nlohmann::json::parse(R"([{"player_id": 7, "result": "bye"}])"), matches, &error));
    EXPECT_NE(error.find("Invalid match record"), std::string::npos);
}

TEST(JsonCodecTest, MatchesWriteNullOpponentForByes) {
    Match bye;
    bye.id = "b";
    bye.player_id = "Z";
    bye.result = MatchResult::Bye;
    const auto node = MatchesToJson({bye});
    ASSERT_EQ(node.size(), 1u);
    EXPECT_TRUE(node.at(0).at("opponent_id").is_null());
    EXPECT_EQ(node.at(0).at("result"), "BYE");
}

TEST(JsonCodecTest, StandingsRoundTrip) {
    StandingRow row;
    row.rank = 1;
    row.player_id = "A";
    row.match_points = 6.0;
    row.mwp = 1.0;
    row.omwp = 0.5;
    row.wins = 2;
    row.rounds_played = 2;
    row.opponents = {"B", "C"};

    const auto node = StandingsToJson({row});
    EXPECT_FALSE(node.at(0).contains("elim_round"));
    EXPECT_EQ(node.at(0).at("opponents"), nlohmann::json::array({"B", "C"}));

    std::vector<StandingRow> rows;
    std::string error;
    ASSERT_TRUE(StandingsFromJson(node, rows, &error)) << error;
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].player_id, "A");
    EXPECT_DOUBLE_EQ(rows[0].match_points, 6.0);
    EXPECT_DOUBLE_EQ(rows[0].omwp, 0.5);
    EXPECT_EQ(rows[0].wins, 2);
    EXPECT_EQ(rows[0].opponents, (std::vector<std::string>{"B", "C"}));

    row.elim_round = 3;
    EXPECT_EQ(StandingsToJson({row}).at(0).at("elim_round"), 3);

    EXPECT_FALSE(StandingsFromJson(nlohmann::json::parse(R"([{"rank": 1}])"), rows, &error));
    EXPECT_EQ(error, "standings[0] is missing player_id.");
}

TEST(JsonCodecTest, PlayerList) {
    std::vector<std::string> players;
    std::string error;
    ASSERT_TRUE(PlayersFromJson(nlohmann::json::parse(R"(["A", "B", "C"])"), players, &error)) << error;
    EXPECT_EQ(players, (std::vector<std::string>{"A", "B", "C"}));

    EXPECT_FALSE(PlayersFromJson(nlohmann::json(), players, &error));
    EXPECT_EQ(error, "players must be an array.");
    EXPECT_FALSE(PlayersFromJson(nlohmann::json::parse("[1, 2]"), players, &error));
}

TEST(JsonCodecTest, PairingResultShape) {
    pairing::PairingResult swiss;
    swiss.pairings = {{"A", "B"}};
    swiss.downfloats = {{"C", 1}};
    const auto swiss_node = PairingResultToJson(swiss);
    EXPECT_TRUE(swiss_node.at("bye").is_null());
    EXPECT_EQ(swiss_node.at("pairings").at(0).at("a"), "A");
    EXPECT_EQ(swiss_node.at("downfloats").at("C"), 1);
    EXPECT_TRUE(swiss_node.at("rematches_used").empty());
    EXPECT_FALSE(swiss_node.contains("round"));

    pairing::PairingResult round_robin;
    round_robin.pairings = {{"A", "C"}};
    round_robin.bye = "B";
    round_robin.round = 2;
    round_robin.byes = {"B"};
    const auto rr_node = PairingResultToJson(round_robin);
    EXPECT_EQ(rr_node.at("bye"), "B");
    EXPECT_EQ(rr_node.at("round"), 2);
    EXPECT_EQ(rr_node.at("byes"), nlohmann::json::array({"B"}));
}

TEST(JsonCodecTest, ScheduleShape) {
    pairing::RoundDefinition first;
    first.round = 1;
    first.pairings = {{"A", "D"}, {"B", "C"}};
    pairing::RoundDefinition second;
    second.round = 2;
    second.pairings = {{"A", "C"}};
    second.byes = {"B"};

    const auto node = ScheduleToJson({first, second});
    ASSERT_EQ(node.size(), 2u);
    EXPECT_EQ(node.at(0).at("pairings").size(), 2u);
    EXPECT_TRUE(node.at(0).at("byes").empty());
    EXPECT_EQ(node.at(1), RoundToJson(second));
    EXPECT_EQ(node.at(1).at("byes").at(0), "B");
}

TEST(JsonCodecTest, RatingInputsAndOutput) {
    ratings::RatingMap base;
    std::string error;
    ASSERT_TRUE(RatingMapFromJson(nlohmann::json::parse(R"({"A": 1600, "B": 1450.5})"), base, &error)) << error;
    EXPECT_DOUBLE_EQ(base.at("B"), 1450.5);
    ASSERT_TRUE(RatingMapFromJson(nlohmann::json(), base, &error));
    EXPECT_TRUE(base.empty());
    EXPECT_FALSE(RatingMapFromJson(nlohmann::json::parse(R"({"A": "high"})"), base, &error));

    std::vector<ratings::EloMatch> matches;
    ASSERT_TRUE(EloMatchesFromJson(
        nlohmann::json::parse(R"([{"a": "A", "b": "B", "result": "A"}, {"a": "B", "b": "C", "result": "draw",
                                  "weight": 0.5}])"),
        matches, &error))
        << error;
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].result, ratings::EloOutcome::A);
    EXPECT_DOUBLE_EQ(matches[0].weight, 1.0);
    EXPECT_EQ(matches[1].result, ratings::EloOutcome::Draw);
    EXPECT_DOUBLE_EQ(matches[1].weight, 0.5);

    EXPECT_FALSE(EloMatchesFromJson(nlohmann::json::parse(R"([{"a": "A", "result": "A"}])"), matches, &error));
    EXPECT_EQ(error, "matches[0] needs both a and b.");
    EXPECT_FALSE(
        EloMatchesFromJson(nlohmann::json::parse(R"([{"a": "A", "b": "B", "result": "win"}])"), matches, &error));
    EXPECT_EQ(error, "matches[0]: unknown result 'win'.");

    ratings::EloUpdateResult result;
    result.ratings = {{"A", 1516.0}, {"B", 1484.0}};
    result.deltas = {{"A", 16.0}, {"B", -16.0}};
    const auto node = EloResultToJson(result);
    EXPECT_EQ(node.at("mode"), "elo");
    EXPECT_DOUBLE_EQ(node.at("ratings").at("A").get<double>(), 1516.0);
    EXPECT_DOUBLE_EQ(node.at("deltas").at("B").get<double>(), -16.0);
}

}  // namespace rankcore::core::api
