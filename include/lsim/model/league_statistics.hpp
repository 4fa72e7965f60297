#pragma once

/// @file league_statistics.hpp
/// @brief League-wide scoring and draw-rate estimates.

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"

namespace lsim::model {

/// Static utility for whole-league aggregates.
///
/// Every match appears twice in a league table (once per side), so match
/// counts are the summed M halved.
class LeagueStatistics {
public:
    LeagueStatistics() = delete;

    /// Draw rate used when no matches have been played yet.
    static constexpr double kDefaultDrawProb = 0.25;

    /// Average goals per team per match: sum(GF) / (sum(M) / 2) / 2.
    ///
    /// @return The rate, or EmptyStandings / DegenerateLeague (no matches).
    [[nodiscard]] static foundation::SimResult<double> calculateBaseGoals(
        const Standings& standings);

    /// League draw rate: (sum(D) / 2) / (sum(M) / 2).
    /// Returns kDefaultDrawProb when no matches have been played.
    [[nodiscard]] static double estimateDrawProb(const Standings& standings);

    /// Same estimate over running counters.
    [[nodiscard]] static double estimateDrawProb(const RunningCounters& counters);
};

} // namespace lsim::model
