#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rankcore::core::ratings {

using PlayerId = std::string;
using RatingMap = std::map<PlayerId, double>;

constexpr double kDefaultRating = 1500.0;

enum class EloOutcome {
    A,
    B,
    Draw
};

struct EloMatch {
    PlayerId a;
    PlayerId b;
    EloOutcome result = EloOutcome::Draw;
    double weight = 1.0;
};

enum class EloUpdateMode {
    Sequential,
    Simultaneous
};

struct EloOptions {
    double k = 32.0;
    // Falls back to `k` when unset.
    std::optional<double> k_draw;
    std::map<PlayerId, double> per_player_k;
    double initial_rating = kDefaultRating;
    std::optional<double> floor;
    std::optional<double> cap;
    EloUpdateMode mode = EloUpdateMode::Sequential;
    double draw_score = 0.5;
    // Optional replacement for ExpectedScore. A throw or a non-finite value
    // falls back to the logistic formula for that call.
    std::function<double(double, double)> expected_score;
};

struct EloUpdateResult {
    RatingMap ratings;
    // Sum of unclamped deltas per player.
    RatingMap deltas;
};

// 1 / (1 + 10^((rating_b - rating_a) / 400)).
double ExpectedScore(double rating_a, double rating_b);

EloUpdateResult UpdateEloRatings(const RatingMap& base,
                                 const std::vector<EloMatch>& matches,
                                 const EloOptions& options);

struct RatingsRequest {
    std::string mode = "elo";
    RatingMap base;
    std::vector<EloMatch> matches;
    EloOptions elo;
};

bool UpdateRatings(const RatingsRequest& request, EloUpdateResult& result, std::string* error);

std::string OutcomeToString(EloOutcome outcome);
bool ParseOutcome(const std::string& value, EloOutcome& outcome);
std::string UpdateModeToString(EloUpdateMode mode);
bool ParseUpdateMode(const std::string& value, EloUpdateMode& mode);

}  // namespace rankcore::core::ratings
