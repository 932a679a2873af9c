#include "rankcore/core/pairing/ScoreGroups.h"

#include "rankcore/core/standings/RankingSorter.h"

namespace rankcore::core::pairing {

std::vector<ScoreGroup> PartitionScoreGroups(const std::vector<standings::StandingRow>& ranked) {
    std::vector<ScoreGroup> groups;
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (groups.empty() || !standings::SameTieKey(ranked[groups.back().front()], ranked[i])) {
            groups.emplace_back();
        }
        groups.back().push_back(i);
    }
    return groups;
}

std::vector<int> GroupIndexByPosition(const std::vector<ScoreGroup>& groups, size_t count) {
    std::vector<int> index(count, -1);
    for (size_t g = 0; g < groups.size(); ++g) {
        for (size_t position : groups[g]) {
            if (position < count) {
                index[position] = static_cast<int>(g);
            }
        }
    }
    return index;
}

}  // namespace rankcore::core::pairing
