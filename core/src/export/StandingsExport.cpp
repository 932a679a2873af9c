#include "rankcore/core/export/StandingsExport.h"

#include "rankcore/core/util/AtomicFileWriter.h"

#include <iomanip>
#include <sstream>

namespace rankcore::core::exporter {

std::string StandingsToCsv(const std::vector<standings::StandingRow>& rows) {
    std::ostringstream output;
    output << "rank,player_id,mp,w,l,d,byes,mwp,omwp,gwp,ogwp,sb,penalties\n";
    output << std::fixed;
    for (const auto& row : rows) {
        output << row.rank << ','
               << row.player_id << ','
               << std::setprecision(2) << row.match_points << ','
               << row.wins << ','
               << row.losses << ','
               << row.draws << ','
               << row.byes << ','
               << std::setprecision(4) << row.mwp << ','
               << row.omwp << ','
               << row.gwp << ','
               << row.ogwp << ','
               << std::setprecision(2) << row.sb << ','
               << row.penalties
               << "\n";
    }
    return output.str();
}

bool WriteStandingsCsv(const std::string& path,
                       const std::vector<standings::StandingRow>& rows,
                       std::string* error) {
    return util::AtomicFileWriter::Write(path, StandingsToCsv(rows), error);
}

}  // namespace rankcore::core::exporter
