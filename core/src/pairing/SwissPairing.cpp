#include "rankcore/core/pairing/SwissPairing.h"

#include "rankcore/core/pairing/ScoreGroups.h"
#include "rankcore/core/standings/RankingSorter.h"
#include "rankcore/core/util/DeterministicHash.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <set>
#include <sstream>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace rankcore::core::pairing {

namespace {

long long PairKey(int a, int b) {
    const int low = std::min(a, b);
    const int high = std::max(a, b);
    return (static_cast<long long>(low) << 32) | static_cast<unsigned int>(high);
}

std::pair<PlayerId, PlayerId> PlayerPair(const PlayerId& a, const PlayerId& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

const char* RelaxationName(Relaxation level) {
    switch (level) {
        case Relaxation::Strict:
            return "strict";
        case Relaxation::AllowRematch:
            return "allow-rematch";
        case Relaxation::AllowProtectedFloat:
            return "allow-protected-float";
    }
    return "strict";
}

// Players in processing order with everything the search needs, all indexed 0..n-1.
struct PairingField {
    std::vector<PlayerId> ids;
    std::vector<int> rank_position;
    std::vector<int> natural_group;
    std::vector<bool> protected_player;
    std::vector<bool> designated_floater;
    std::unordered_set<long long> played;
    bool avoid_rematches = true;
    // Only designated floaters may leave their score group.
    bool restrict_floaters = false;

    size_t size() const { return ids.size(); }
    bool IsRematch(int a, int b) const { return played.count(PairKey(a, b)) > 0; }
};

enum class SearchOutcome {
    Complete,
    Exhausted,
    BoundReached
};

struct SearchFrame {
    int player = -1;
    std::vector<int> candidates;
    size_t cursor = 0;
    int partner = -1;
    int saved_player_group = -1;
    int saved_partner_group = -1;
};

// Depth-first search over pairing decisions with an explicit undo stack.
class PairingSearch {
public:
    PairingSearch(const PairingField& field, Relaxation level, long long max_attempts)
        : field_(field),
          level_(level),
          max_attempts_(max_attempts),
          partner_(field.size(), -1),
          effective_group_(field.natural_group) {}

    SearchOutcome Run() {
        while (true) {
            const int player = FirstUnpaired();
            if (player < 0) {
                return SearchOutcome::Complete;
            }
            SearchFrame frame;
            frame.player = player;
            frame.candidates = Candidates(player);
            stack_.push_back(std::move(frame));
            if (!PlaceNext()) {
                return outcome_;
            }
        }
    }

    std::vector<std::pair<int, int>> Pairs() const {
        std::vector<std::pair<int, int>> pairs;
        pairs.reserve(stack_.size());
        for (const auto& frame : stack_) {
            pairs.emplace_back(frame.player, frame.partner);
        }
        return pairs;
    }

    const std::vector<int>& effective_groups() const { return effective_group_; }
    long long attempts() const { return attempts_; }

private:
    struct Option {
        int index = -1;
        bool rematch = false;
        bool protected_float = false;
        int group_distance = 0;
        int distance = 0;
    };

    int FirstUnpaired() const {
        for (size_t i = 0; i < partner_.size(); ++i) {
            if (partner_[i] < 0) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    std::vector<int> Candidates(int player) const {
        std::vector<Option> options;
        for (int c = player + 1; c < static_cast<int>(field_.size()); ++c) {
            if (partner_[static_cast<size_t>(c)] >= 0) {
                continue;
            }
            Option option;
            option.index = c;
            option.rematch = field_.avoid_rematches && field_.IsRematch(player, c);
            option.group_distance = field_.natural_group[static_cast<size_t>(c)] -
                                    field_.natural_group[static_cast<size_t>(player)];
            option.protected_float = option.group_distance != 0 &&
                                     field_.protected_player[static_cast<size_t>(player)];
            option.distance = c - player;
            if (option.group_distance != 0 && field_.restrict_floaters &&
                !field_.designated_floater[static_cast<size_t>(player)]) {
                continue;
            }
            if (option.rematch && level_ == Relaxation::Strict) {
                continue;
            }
            if (option.protected_float && level_ != Relaxation::AllowProtectedFloat) {
                continue;
            }
            options.push_back(option);
        }

        std::sort(options.begin(), options.end(), [](const Option& a, const Option& b) {
            return std::tie(a.rematch, a.protected_float, a.group_distance, a.distance) <
                   std::tie(b.rematch, b.protected_float, b.group_distance, b.distance);
        });

        std::vector<int> candidates;
        candidates.reserve(options.size());
        for (const auto& option : options) {
            candidates.push_back(option.index);
        }
        return candidates;
    }

    bool PlaceNext() {
        while (!stack_.empty()) {
            SearchFrame& top = stack_.back();
            if (top.partner >= 0) {
                Undo(top);
            }
            if (top.cursor < top.candidates.size()) {
                if (max_attempts_ >= 0 && attempts_ >= max_attempts_) {
                    outcome_ = SearchOutcome::BoundReached;
                    return false;
                }
                ++attempts_;
                Place(top, top.candidates[top.cursor++]);
                return true;
            }
            stack_.pop_back();
        }
        outcome_ = SearchOutcome::Exhausted;
        return false;
    }

    void Place(SearchFrame& frame, int partner) {
        const auto p = static_cast<size_t>(frame.player);
        const auto c = static_cast<size_t>(partner);
        frame.partner = partner;
        frame.saved_player_group = effective_group_[p];
        frame.saved_partner_group = effective_group_[c];
        const int shared_group = std::max(field_.natural_group[p], field_.natural_group[c]);
        effective_group_[p] = shared_group;
        effective_group_[c] = shared_group;
        partner_[p] = partner;
        partner_[c] = frame.player;
    }

    void Undo(SearchFrame& frame) {
        const auto p = static_cast<size_t>(frame.player);
        const auto c = static_cast<size_t>(frame.partner);
        effective_group_[p] = frame.saved_player_group;
        effective_group_[c] = frame.saved_partner_group;
        partner_[p] = -1;
        partner_[c] = -1;
        frame.partner = -1;
    }

    const PairingField& field_;
    Relaxation level_;
    long long max_attempts_;
    long long attempts_ = 0;
    std::vector<int> partner_;
    std::vector<int> effective_group_;
    std::vector<SearchFrame> stack_;
    SearchOutcome outcome_ = SearchOutcome::Exhausted;
};

std::vector<StandingRow> RankedField(const std::vector<StandingRow>& rows, const std::string& event_id) {
    std::vector<StandingRow> ranked = rows;
    std::unordered_map<PlayerId, std::uint32_t> fallback;
    for (const auto& row : ranked) {
        fallback[row.player_id] =
            util::TieBreakHash(event_id, standings::roles::kPairingFallback, row.player_id);
    }
    std::sort(ranked.begin(), ranked.end(), [&](const StandingRow& a, const StandingRow& b) {
        if (a.rank != b.rank) {
            return a.rank < b.rank;
        }
        const auto ha = fallback[a.player_id];
        const auto hb = fallback[b.player_id];
        if (ha != hb) {
            return ha < hb;
        }
        return a.player_id < b.player_id;
    });

    std::set<PlayerId> seen;
    std::vector<StandingRow> unique;
    unique.reserve(ranked.size());
    for (auto& row : ranked) {
        if (seen.insert(row.player_id).second) {
            unique.push_back(std::move(row));
        }
    }
    return unique;
}

int PriorDownfloats(const SwissPairingOptions& options, const PlayerId& id) {
    const auto it = options.prior_downfloats.find(id);
    return it != options.prior_downfloats.end() ? it->second : 0;
}

// A score group that cannot pair internally and the members that may drop out of it,
// most preferred first.
struct FloaterSlot {
    size_t group = 0;
    std::vector<size_t> choices;
};

std::vector<FloaterSlot> FloaterSlots(const std::vector<StandingRow>& ranked,
                                      const std::vector<ScoreGroup>& groups,
                                      const std::vector<bool>& protected_position,
                                      const SwissPairingOptions& options,
                                      bool allow_protected) {
    const auto by_preference = [&](size_t a, size_t b) {
        const int da = PriorDownfloats(options, ranked[a].player_id);
        const int db = PriorDownfloats(options, ranked[b].player_id);
        if (da != db) {
            return da < db;
        }
        return a > b;
    };

    std::vector<FloaterSlot> slots;
    bool incoming = false;
    for (size_t g = 0; g < groups.size(); ++g) {
        const ScoreGroup& members = groups[g];
        const bool odd = (members.size() + (incoming ? 1 : 0)) % 2 == 1;
        incoming = odd && g + 1 < groups.size() && !members.empty();
        if (!incoming) {
            continue;
        }
        std::vector<size_t> open;
        std::vector<size_t> guarded;
        for (size_t position : members) {
            (protected_position[position] ? guarded : open).push_back(position);
        }
        std::sort(open.begin(), open.end(), by_preference);
        std::sort(guarded.begin(), guarded.end(), by_preference);

        FloaterSlot slot;
        slot.group = g;
        slot.choices = open;
        if (allow_protected) {
            slot.choices.insert(slot.choices.end(), guarded.begin(), guarded.end());
        }
        if (slot.choices.empty()) {
            slot.choices.push_back(members.back());
        }
        slots.push_back(std::move(slot));
    }
    return slots;
}

// Steps `pick` to the next combination of floater choices; false once all were tried.
bool NextPick(std::vector<size_t>& pick, const std::vector<FloaterSlot>& slots) {
    for (size_t i = pick.size(); i-- > 0;) {
        if (++pick[i] < slots[i].choices.size()) {
            return true;
        }
        pick[i] = 0;
    }
    return false;
}

// Positions in processing order, each chosen floater moved to the end of its group.
std::vector<size_t> ProcessingOrder(const std::vector<ScoreGroup>& groups,
                                    const std::vector<FloaterSlot>& slots,
                                    const std::vector<size_t>& pick,
                                    std::vector<bool>& floater_position) {
    std::vector<size_t> order;
    size_t next_slot = 0;
    for (size_t g = 0; g < groups.size(); ++g) {
        ScoreGroup members = groups[g];
        if (next_slot < slots.size() && slots[next_slot].group == g) {
            const size_t position = slots[next_slot].choices[pick[next_slot]];
            members.erase(std::find(members.begin(), members.end(), position));
            members.push_back(position);
            floater_position[position] = true;
            ++next_slot;
        }
        order.insert(order.end(), members.begin(), members.end());
    }
    return order;
}

PairingField BuildField(const std::vector<StandingRow>& ranked,
                        const std::vector<size_t>& order,
                        const std::vector<int>& group_of,
                        const std::vector<bool>& protected_position,
                        const std::vector<bool>& floater_position,
                        const std::set<std::pair<PlayerId, PlayerId>>& played,
                        const SwissPairingOptions& options) {
    PairingField field;
    field.avoid_rematches = options.avoid_rematches;
    std::unordered_map<PlayerId, int> index_of;
    for (size_t i = 0; i < order.size(); ++i) {
        const size_t position = order[i];
        field.ids.push_back(ranked[position].player_id);
        field.rank_position.push_back(static_cast<int>(position));
        field.natural_group.push_back(group_of[position]);
        field.protected_player.push_back(protected_position[position]);
        field.designated_floater.push_back(floater_position[position]);
        index_of[ranked[position].player_id] = static_cast<int>(i);
    }
    for (const auto& pair : played) {
        const auto a = index_of.find(pair.first);
        const auto b = index_of.find(pair.second);
        if (a != index_of.end() && b != index_of.end()) {
            field.played.insert(PairKey(a->second, b->second));
        }
    }
    return field;
}

void CollectPairings(const PairingField& field, const PairingSearch& search, PairingResult& out) {
    const auto& effective = search.effective_groups();
    for (const auto& decision : search.Pairs()) {
        const auto p = static_cast<size_t>(decision.first);
        const auto c = static_cast<size_t>(decision.second);
        Pairing pairing;
        if (field.rank_position[p] < field.rank_position[c]) {
            pairing = {field.ids[p], field.ids[c]};
        } else {
            pairing = {field.ids[c], field.ids[p]};
        }
        if (field.avoid_rematches && field.IsRematch(decision.first, decision.second)) {
            out.rematches_used.push_back(pairing);
        }
        for (size_t member : {p, c}) {
            if (effective[member] != field.natural_group[member]) {
                out.downfloats[field.ids[member]] += 1;
            }
        }
        out.pairings.push_back(std::move(pairing));
    }
}

void Log(const SwissPairingOptions& options, const std::string& line) {
    if (options.log) {
        options.log(line);
    }
}

void Publish(const PairingField& field,
             const PairingSearch& search,
             Relaxation level,
             long long attempts,
             const SwissPairingOptions& options,
             PairingResult& out,
             PairingResult& result) {
    CollectPairings(field, search, out);
    std::ostringstream line;
    line << "[pairing] level " << RelaxationName(level) << " paired " << out.pairings.size() << " boards in "
         << attempts << " attempts";
    Log(options, line.str());
    result = std::move(out);
}

}  // namespace

bool GenerateSwissPairings(const std::vector<StandingRow>& current_standings,
                           const std::vector<Match>& history,
                           const SwissPairingOptions& options,
                           PairingResult& result,
                           std::string* error) {
    std::vector<StandingRow> ranked = RankedField(current_standings, options.event_id);
    if (ranked.empty()) {
        if (error) {
            *error = "Cannot pair an empty field.";
        }
        return false;
    }

    std::set<PlayerId> had_bye;
    std::set<std::pair<PlayerId, PlayerId>> played;
    for (const auto& match : history) {
        if (match.is_bye() || match.result == standings::MatchResult::Bye) {
            had_bye.insert(match.player_id);
        } else if (*match.opponent_id != match.player_id) {
            played.insert(PlayerPair(match.player_id, *match.opponent_id));
        }
    }

    PairingResult out;
    for (const auto& row : ranked) {
        out.downfloats[row.player_id] = PriorDownfloats(options, row.player_id);
    }

    if (ranked.size() % 2 == 1) {
        if (!options.allow_bye) {
            if (error) {
                std::ostringstream message;
                message << "Cannot pair an odd number of competitors (" << ranked.size()
                        << ") with byes disallowed.";
                *error = message.str();
            }
            return false;
        }
        for (auto it = ranked.rbegin(); it != ranked.rend(); ++it) {
            if (had_bye.count(it->player_id) == 0) {
                out.bye = it->player_id;
                ranked.erase(std::next(it).base());
                break;
            }
        }
        if (!out.bye.has_value()) {
            out.bye = ranked.back().player_id;
            ranked.pop_back();
        }
        Log(options, "[pairing] bye -> " + *out.bye);
    }

    if (ranked.empty()) {
        result = std::move(out);
        return true;
    }

    const auto groups = PartitionScoreGroups(ranked);
    const auto group_of = GroupIndexByPosition(groups, ranked.size());
    std::vector<bool> protected_position(ranked.size(), false);
    for (size_t i = 0; i < ranked.size(); ++i) {
        protected_position[i] = static_cast<long long>(i) < static_cast<long long>(options.protect_top_n);
    }

    std::vector<Relaxation> levels{Relaxation::Strict};
    if (options.avoid_rematches) {
        levels.push_back(Relaxation::AllowRematch);
    }
    if (options.protect_top_n > 0) {
        levels.push_back(Relaxation::AllowProtectedFloat);
    }

    const long long budget = std::max(0LL, options.max_backtrack);
    for (size_t l = 0; l < levels.size(); ++l) {
        const Relaxation level = levels[l];
        const bool final_level = l + 1 == levels.size();
        const auto slots =
            FloaterSlots(ranked, groups, protected_position, options, level == Relaxation::AllowProtectedFloat);
        long long spent = 0;
        bool bound_reached = false;

        // Floater combinations in preference order, each group shedding only its chosen member.
        std::vector<size_t> pick(slots.size(), 0);
        do {
            if (spent >= budget) {
                bound_reached = true;
                break;
            }
            std::vector<bool> floater_position(ranked.size(), false);
            const auto order = ProcessingOrder(groups, slots, pick, floater_position);
            PairingField field =
                BuildField(ranked, order, group_of, protected_position, floater_position, played, options);
            field.restrict_floaters = true;
            PairingSearch search(field, level, budget - spent);
            const SearchOutcome outcome = search.Run();
            spent += std::max(1LL, search.attempts());
            if (outcome == SearchOutcome::Complete) {
                Publish(field, search, level, spent, options, out, result);
                return true;
            }
            bound_reached = bound_reached || outcome == SearchOutcome::BoundReached;
        } while (NextPick(pick, slots));

        // Any member may float; the final level runs without a bound.
        std::fill(pick.begin(), pick.end(), 0);
        std::vector<bool> floater_position(ranked.size(), false);
        const auto order = ProcessingOrder(groups, slots, pick, floater_position);
        const PairingField field =
            BuildField(ranked, order, group_of, protected_position, floater_position, played, options);
        PairingSearch search(field, level, final_level ? -1 : std::max(0LL, budget - spent));
        const SearchOutcome outcome = search.Run();
        spent += search.attempts();
        if (outcome == SearchOutcome::Complete) {
            Publish(field, search, level, spent, options, out, result);
            return true;
        }
        bound_reached = bound_reached || outcome == SearchOutcome::BoundReached;

        std::ostringstream line;
        line << "[pairing] level " << RelaxationName(level) << " failed after " << spent << " attempts ("
             << (bound_reached ? "bound reached" : "exhausted") << ")";
        Log(options, line.str());
    }

    if (error) {
        std::ostringstream message;
        message << "No legal pairing exists for " << ranked.size() << " competitors.";
        *error = message.str();
    }
    return false;
}

}  // namespace rankcore::core::pairing
