#pragma once

#include "rankcore/core/standings/MatchTypes.h"

#include <string>
#include <vector>

namespace rankcore::core::exporter {

// One line per row in the given order; points with two decimals, percentages with four.
std::string StandingsToCsv(const std::vector<standings::StandingRow>& rows);

bool WriteStandingsCsv(const std::string& path,
                       const std::vector<standings::StandingRow>& rows,
                       std::string* error);

}  // namespace rankcore::core::exporter
