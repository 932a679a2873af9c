#include "rankcore/core/ratings/Elo.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>

namespace rankcore::core::ratings {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

double LookupRating(const RatingMap& ratings, const RatingMap& base, const PlayerId& id, double initial) {
    auto it = ratings.find(id);
    if (it != ratings.end()) {
        return it->second;
    }
    it = base.find(id);
    if (it != base.end()) {
        return it->second;
    }
    return initial;
}

class EloUpdater {
public:
    EloUpdater(const RatingMap& base, const EloOptions& options)
        : base_(base), options_(options), ratings_(base) {}

    void Run(const std::vector<EloMatch>& matches) {
        const bool simultaneous = options_.mode == EloUpdateMode::Simultaneous;
        const RatingMap snapshot = ratings_;
        for (const auto& match : matches) {
            const RatingMap& source = simultaneous ? snapshot : ratings_;
            const double rating_a = LookupRating(source, base_, match.a, options_.initial_rating);
            const double rating_b = LookupRating(source, base_, match.b, options_.initial_rating);

            const double expected_a = Expected(rating_a, rating_b);
            const double expected_b = 1.0 - expected_a;
            const double score_a = ScoreOfA(match.result);
            const double score_b = 1.0 - score_a;

            const double base_k = match.result == EloOutcome::Draw ? options_.k_draw.value_or(options_.k)
                                                                   : options_.k;
            Apply(match.a, match.weight * KFor(match.a, base_k) * (score_a - expected_a));
            Apply(match.b, match.weight * KFor(match.b, base_k) * (score_b - expected_b));
        }
    }

    EloUpdateResult TakeResult() {
        EloUpdateResult result;
        result.ratings = std::move(ratings_);
        result.deltas = std::move(deltas_);
        return result;
    }

private:
    double Expected(double rating_a, double rating_b) const {
        if (!options_.expected_score) {
            return ExpectedScore(rating_a, rating_b);
        }
        try {
            const double value = options_.expected_score(rating_a, rating_b);
            if (std::isfinite(value)) {
                return value;
            }
        } catch (const std::exception&) {
            // Backend failures fall through to the logistic curve.
        }
        return ExpectedScore(rating_a, rating_b);
    }

    double ScoreOfA(EloOutcome outcome) const {
        switch (outcome) {
            case EloOutcome::A:
                return 1.0;
            case EloOutcome::B:
                return 0.0;
            case EloOutcome::Draw:
                return options_.draw_score;
        }
        return options_.draw_score;
    }

    double KFor(const PlayerId& id, double base_k) const {
        const auto it = options_.per_player_k.find(id);
        return it != options_.per_player_k.end() ? it->second : base_k;
    }

    void Apply(const PlayerId& id, double delta) {
        const auto it = ratings_.find(id);
        const double before = it != ratings_.end() ? it->second : options_.initial_rating;
        double after = before + delta;
        if (options_.floor) {
            after = std::max(*options_.floor, after);
        }
        if (options_.cap) {
            after = std::min(*options_.cap, after);
        }
        ratings_[id] = after;
        deltas_[id] += delta;
    }

    const RatingMap& base_;
    const EloOptions& options_;
    RatingMap ratings_;
    RatingMap deltas_;
};

}  // namespace

double ExpectedScore(double rating_a, double rating_b) {
    return 1.0 / (1.0 + std::pow(10.0, (rating_b - rating_a) / 400.0));
}

EloUpdateResult UpdateEloRatings(const RatingMap& base,
                                 const std::vector<EloMatch>& matches,
                                 const EloOptions& options) {
    EloUpdater updater(base, options);
    updater.Run(matches);
    return updater.TakeResult();
}

bool UpdateRatings(const RatingsRequest& request, EloUpdateResult& result, std::string* error) {
    if (request.mode != "elo") {
        if (error) {
            *error = "Unsupported ratings mode: " + request.mode;
        }
        return false;
    }
    result = UpdateEloRatings(request.base, request.matches, request.elo);
    return true;
}

std::string OutcomeToString(EloOutcome outcome) {
    switch (outcome) {
        case EloOutcome::A:
            return "A";
        case EloOutcome::B:
            return "B";
        case EloOutcome::Draw:
            return "draw";
    }
    return "draw";
}

bool ParseOutcome(const std::string& value, EloOutcome& outcome) {
    if (value == "A" || value == "a") {
        outcome = EloOutcome::A;
        return true;
    }
    if (value == "B" || value == "b") {
        outcome = EloOutcome::B;
        return true;
    }
    const std::string lower = ToLower(value);
    if (lower == "draw" || lower == "d") {
        outcome = EloOutcome::Draw;
        return true;
    }
    return false;
}

std::string UpdateModeToString(EloUpdateMode mode) {
    return mode == EloUpdateMode::Simultaneous ? "simultaneous" : "sequential";
}

bool ParseUpdateMode(const std::string& value, EloUpdateMode& mode) {
    const std::string lower = ToLower(value);
    if (lower == "sequential") {
        mode = EloUpdateMode::Sequential;
        return true;
    }
    if (lower == "simultaneous") {
        mode = EloUpdateMode::Simultaneous;
        return true;
    }
    return false;
}

}  // namespace rankcore::core::ratings
