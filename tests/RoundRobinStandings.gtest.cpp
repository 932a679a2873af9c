#include <gtest/gtest.h>

#include "TestFixtures.h"
#include "rankcore/core/standings/StandingsEngine.h"

#include <set>

namespace rankcore::core::standings {

using test_support::MakeBye;
using test_support::MakeMatch;
using test_support::RowFor;

namespace {

RoundRobinStandingsOptions Lenient(const std::string& event_id) {
    RoundRobinStandingsOptions options;
    options.event_id = event_id;
    options.accept_single_entry_matches = true;
    return options;
}

std::vector<StandingRow> RoundRobin(const std::vector<Match>& matches, const RoundRobinStandingsOptions& options) {
    std::vector<StandingRow> rows;
    std::string error;
    EXPECT_TRUE(ComputeRoundRobinStandings(matches, options, rows, &error)) << error;
    return rows;
}

}  // namespace

TEST(RoundRobinStandingsTest, FourPlayerSingleEntryField) {
    const std::vector<Match> matches{
        MakeMatch("r1-ab", 1, "A", std::string("B"), MatchResult::Win, 2, 0),
        MakeMatch("r1-cd", 1, "C", std::string("D"), MatchResult::Loss, 0, 2),
        MakeMatch("r2-ac", 2, "A", std::string("C"), MatchResult::Loss, 1, 2),
        MakeMatch("r2-bd", 2, "B", std::string("D"), MatchResult::Win, 2, 1),
        MakeMatch("r3-ad", 3, "A", std::string("D"), MatchResult::Loss, 0, 2),
        MakeMatch("r3-bc", 3, "B", std::string("C"), MatchResult::Win, 2, 0),
    };
    const auto rows = RoundRobin(matches, Lenient("RR-BASIC"));
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_DOUBLE_EQ(RowFor(rows, "A").match_points, 3.0);
    EXPECT_DOUBLE_EQ(RowFor(rows, "B").match_points, 6.0);
    EXPECT_DOUBLE_EQ(RowFor(rows, "C").match_points, 3.0);
    EXPECT_DOUBLE_EQ(RowFor(rows, "D").match_points, 6.0);

    std::set<int> ranks;
    for (const auto& row : rows) {
        ranks.insert(row.rank);
    }
    EXPECT_EQ(ranks.size(), rows.size());
}

TEST(RoundRobinStandingsTest, ForfeitsDoNotFabricateGames) {
    const auto rows = RoundRobin({MakeMatch("ef", 1, "E", std::string("F"), MatchResult::ForfeitWin)},
                                 Lenient("RR-FF"));
    EXPECT_DOUBLE_EQ(RowFor(rows, "E").match_points, 3.0);
    EXPECT_DOUBLE_EQ(RowFor(rows, "F").match_points, 0.0);
    EXPECT_EQ(RowFor(rows, "E").game_wins, 0);
    EXPECT_EQ(RowFor(rows, "F").game_wins, 0);
}

TEST(RoundRobinStandingsTest, ByeScoresAsTwoNilForGwp) {
    const auto rows = RoundRobin({MakeBye("g", 1, "G")}, Lenient("RR-BYE"));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].match_points, 3.0);
    EXPECT_DOUBLE_EQ(rows[0].gwp, 1.0);
    EXPECT_EQ(rows[0].game_wins, 2);
}

TEST(RoundRobinStandingsTest, SonnebornBergerCreditsWinsAndHalfDraws) {
    const std::vector<Match> matches{
        MakeMatch("ab", 1, "A", std::string("B"), MatchResult::Win, 2, 0),
        MakeMatch("bc", 2, "B", std::string("C"), MatchResult::Win, 2, 0),
        MakeMatch("ac", 3, "A", std::string("C"), MatchResult::Draw, 1, 1, 1),
    };
    const auto rows = RoundRobin(matches, Lenient("RR-SB"));
    EXPECT_DOUBLE_EQ(RowFor(rows, "A").match_points, 4.0);
    EXPECT_DOUBLE_EQ(RowFor(rows, "B").match_points, 3.0);
    EXPECT_DOUBLE_EQ(RowFor(rows, "C").match_points, 1.0);
    EXPECT_NEAR(RowFor(rows, "A").sb, 3.0 + 0.5 * 1.0, 1e-10);
}

TEST(RoundRobinStandingsTest, OpponentPercentagesRespectFloor) {
    const std::vector<Match> matches{
        MakeMatch("r1-ed", 1, "E", std::string("D"), MatchResult::Win, 2, 0),
        MakeMatch("r2-df", 2, "D", std::string("F"), MatchResult::Loss, 0, 2),
    };
    const auto rows = RoundRobin(matches, Lenient("RR-FLOOR"));
    EXPECT_GE(RowFor(rows, "E").omwp, 0.33 - 1e-12);
    EXPECT_GE(RowFor(rows, "E").ogwp, 0.33 - 1e-12);
}

TEST(RoundRobinStandingsTest, StrictModeRejectsMissingMirror) {
    std::vector<Match> matches{
        MakeMatch("m1", 1, "A", std::string("B"), MatchResult::Win, 2, 0),
        MakeMatch("m2a", 1, "C", std::string("D"), MatchResult::Win, 2, 0),
        MakeMatch("m2b", 1, "D", std::string("C"), MatchResult::Loss, 0, 2),
    };
    RoundRobinStandingsOptions options;
    options.event_id = "RR-SE-0";
    std::vector<StandingRow> rows;
    std::string error;
    EXPECT_FALSE(ComputeRoundRobinStandings(matches, options, rows, &error));
    EXPECT_TRUE(rows.empty());
    EXPECT_NE(error.find("missing mirrored entry for A vs B in round 1"), std::string::npos) << error;
}

TEST(RoundRobinStandingsTest, SingleEntryEqualsMirroredInput) {
    const std::vector<Match> mirrored{
        MakeMatch("m1a", 1, "A", std::string("B"), MatchResult::Win, 2, 0),
        MakeMatch("m1b", 1, "B", std::string("A"), MatchResult::Loss, 0, 2),
        MakeMatch("m2a", 2, "B", std::string("C"), MatchResult::Win, 2, 1),
        MakeMatch("m2b", 2, "C", std::string("B"), MatchResult::Loss, 1, 2),
        MakeMatch("m3a", 3, "C", std::string("A"), MatchResult::Draw, 1, 1, 1),
        MakeMatch("m3b", 3, "A", std::string("C"), MatchResult::Draw, 1, 1, 1),
    };
    const std::vector<Match> single{
        MakeMatch("s1", 1, "A", std::string("B"), MatchResult::Win, 2, 0),
        MakeMatch("s2", 2, "B", std::string("C"), MatchResult::Win, 2, 1),
        MakeMatch("s3", 3, "C", std::string("A"), MatchResult::Draw, 1, 1, 1),
    };

    RoundRobinStandingsOptions strict;
    strict.event_id = "RR-SE-3";
    const auto full_rows = RoundRobin(mirrored, strict);
    const auto single_rows = RoundRobin(single, Lenient("RR-SE-3"));

    ASSERT_EQ(full_rows.size(), single_rows.size());
    for (size_t i = 0; i < full_rows.size(); ++i) {
        EXPECT_EQ(full_rows[i].player_id, single_rows[i].player_id);
        EXPECT_DOUBLE_EQ(full_rows[i].match_points, single_rows[i].match_points);
        EXPECT_NEAR(full_rows[i].omwp, single_rows[i].omwp, 1e-9);
        EXPECT_NEAR(full_rows[i].gwp, single_rows[i].gwp, 1e-9);
        EXPECT_NEAR(full_rows[i].ogwp, single_rows[i].ogwp, 1e-9);
        EXPECT_NEAR(full_rows[i].sb, single_rows[i].sb, 1e-9);
    }
}

TEST(RoundRobinStandingsTest, ReconstructedMirrorKeepsPenalties) {
    auto entry = MakeMatch("p1", 1, "A", std::string("B"), MatchResult::Draw, 1, 1, 1);
    entry.penalties = 1;
    const auto rows = RoundRobin({entry}, Lenient("RR-PENALTY"));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(RowFor(rows, "A").penalties, 1);
    EXPECT_EQ(RowFor(rows, "B").penalties, 1);
}

TEST(RoundRobinStandingsTest, PercentagesStayInRange) {
    std::vector<Match> matches{
        MakeMatch("r1-ab", 1, "A", std::string("B"), MatchResult::Win, 2, 0),
        MakeMatch("r1-cd", 1, "C", std::string("D"), MatchResult::ForfeitWin),
        MakeBye("r1-e", 1, "E"),
        MakeMatch("r2-ac", 2, "A", std::string("C"), MatchResult::Draw, 1, 1, 1),
        MakeMatch("r2-be", 2, "B", std::string("E"), MatchResult::Loss, 0, 2),
        MakeBye("r2-d", 2, "D"),
    };
    RoundRobinStandingsOptions options = Lenient("RR-RANGE");
    options.opponent_pct_floor = 0.25;
    const auto rows = RoundRobin(matches, options);
    ASSERT_EQ(rows.size(), 5u);
    for (const auto& row : rows) {
        EXPECT_GE(row.mwp, 0.0) << row.player_id;
        EXPECT_LE(row.mwp, 1.0) << row.player_id;
        EXPECT_GE(row.gwp, 0.25) << row.player_id;
        EXPECT_LE(row.gwp, 1.0) << row.player_id;
        if (row.opponents.empty()) {
            EXPECT_EQ(row.omwp, 0.0) << row.player_id;
            EXPECT_EQ(row.ogwp, 0.0) << row.player_id;
        } else {
            EXPECT_GE(row.omwp, 0.25) << row.player_id;
            EXPECT_LE(row.omwp, 1.0) << row.player_id;
            EXPECT_GE(row.ogwp, 0.25) << row.player_id;
            EXPECT_LE(row.ogwp, 1.0) << row.player_id;
        }
    }
}

TEST(RoundRobinStandingsTest, MixedShapesInOneBatch) {
    const std::vector<Match> matches{
        MakeMatch("ab-a", 1, "A", std::string("B"), MatchResult::Win, 2, 0),
        MakeMatch("ab-b", 1, "B", std::string("A"), MatchResult::Loss, 0, 2),
        MakeMatch("cd-c", 1, "C", std::string("D"), MatchResult::Draw, 1, 1, 1),
    };
    const auto rows = RoundRobin(matches, Lenient("RR-MIXED"));
    EXPECT_EQ(rows.size(), 4u);
    EXPECT_DOUBLE_EQ(RowFor(rows, "C").match_points, 1.0);
    EXPECT_DOUBLE_EQ(RowFor(rows, "D").match_points, 1.0);
}

TEST(RoundRobinStandingsTest, RepeatedCallsAreIdentical) {
    const std::vector<Match> matches{
        MakeMatch("d1", 1, "A", std::string("B"), MatchResult::Draw, 1, 1, 1),
        MakeMatch("d2", 2, "B", std::string("C"), MatchResult::Draw, 1, 1, 1),
        MakeMatch("d3", 3, "C", std::string("A"), MatchResult::Draw, 1, 1, 1),
    };
    const auto first = RoundRobin(matches, Lenient("RR-SE-SEED"));
    const auto second = RoundRobin(matches, Lenient("RR-SE-SEED"));
    ASSERT_EQ(first.size(), 3u);
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].player_id, second[i].player_id);
        EXPECT_EQ(first[i].rank, second[i].rank);
    }
}

TEST(StandingsFacadeTest, DispatchesRoundRobinStrictError) {
    StandingsRequest request;
    request.mode = "roundrobin";
    request.matches = {MakeMatch("m1", 1, "A", std::string("B"), MatchResult::Win)};
    std::vector<StandingRow> rows;
    std::string error;
    EXPECT_FALSE(ComputeStandings(request, rows, &error));
    EXPECT_FALSE(error.empty());
}

}  // namespace rankcore::core::standings
