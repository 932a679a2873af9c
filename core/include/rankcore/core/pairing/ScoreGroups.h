#pragma once

#include "rankcore/core/standings/MatchTypes.h"

#include <cstddef>
#include <vector>

namespace rankcore::core::pairing {

using ScoreGroup = std::vector<size_t>;

// Splits a ranked list into runs of adjacent rows sharing the full tie-break signature.
// Each group holds indices into `ranked`.
std::vector<ScoreGroup> PartitionScoreGroups(const std::vector<standings::StandingRow>& ranked);

// Group index of every position in `ranked`.
std::vector<int> GroupIndexByPosition(const std::vector<ScoreGroup>& groups, size_t count);

}  // namespace rankcore::core::pairing
