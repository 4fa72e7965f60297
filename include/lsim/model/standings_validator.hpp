#pragma once

/// @file standings_validator.hpp
/// @brief Data-contract checks for league table input.

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"

namespace lsim::model {

/// Check one team's record: M, GF, GA, D >= 0, D <= M and GD == GF - GA.
///
/// @return Success or InvalidStanding carrying the team name as context.
[[nodiscard]] foundation::SimResult<void> validateStanding(const TeamName& team,
                                                           const TeamStanding& standing);

/// Check a full table. An empty table is EmptyStandings.
[[nodiscard]] foundation::SimResult<void> validateStandings(const Standings& standings);

} // namespace lsim::model
