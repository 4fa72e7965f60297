#pragma once

/// @file league_goal_model.hpp
/// @brief League base scoring rate and per-team attack/defense multipliers.

#include <cstdint>
#include <string_view>

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"

namespace lsim::model {

/// How a team with zero games played enters the league averages.
enum class ZeroGamesPolicy : uint8_t {
    ZeroRate,         ///< Per-game rate of 0, folded into the league mean.
    ImputeLeagueMean  ///< Mean rate of the teams that did play.
};

[[nodiscard]] std::string_view zeroGamesPolicyName(ZeroGamesPolicy policy);

/// Parse "zero_rate" / "impute_mean".
[[nodiscard]] foundation::SimResult<ZeroGamesPolicy> parseZeroGamesPolicy(std::string_view name);

struct GoalModelOptions {
    /// Rescale attack and defense so each has cross-team mean 1.
    bool normalize = true;
    ZeroGamesPolicy zeroGamesPolicy = ZeroGamesPolicy::ImputeLeagueMean;
};

/// Static utility building a GoalModel.
///
/// Per team, goals-for and goals-against per game are divided by the
/// league base rate (mean goals-for per game) and then, when normalizing,
/// each map is divided by its own mean. The two stages keep the league
/// scoring level in baseLambda and only relative strength in the maps.
class LeagueGoalModel {
public:
    LeagueGoalModel() = delete;

    /// Full recompute from a standings snapshot.
    ///
    /// @return The model, or EmptyStandings / InvalidStanding /
    ///         DegenerateLeague.
    [[nodiscard]] static foundation::SimResult<GoalModel> fromStandings(
        const Standings& standings,
        const GoalModelOptions& options = {});

    /// Incremental recompute from running goals-for / goals-against /
    /// games-played counters. The three maps must cover the same teams.
    ///
    /// @return The model, or EmptyStandings / TeamNotFound /
    ///         InvalidStanding / DegenerateLeague.
    [[nodiscard]] static foundation::SimResult<GoalModel> fromCounters(
        const RunningCounters& counters,
        const GoalModelOptions& options = {});

    /// Seed running counters from a standings snapshot.
    [[nodiscard]] static RunningCounters countersFromStandings(const Standings& standings);
};

} // namespace lsim::model
