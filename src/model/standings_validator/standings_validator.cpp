/// @file standings_validator.cpp
/// @brief League table data-contract checks.

#include "lsim/model/standings_validator.hpp"

#include <string>

namespace lsim::model {

using foundation::ErrorCode;
using foundation::SimError;
using foundation::SimResult;

namespace {

SimResult<void> invalid(const TeamName& team, const std::string& reason) {
    return SimResult<void>::err(
        SimError(ErrorCode::InvalidStanding, "invalid standing for '" + team + "': " + reason, team));
}

} // namespace

SimResult<void> validateStanding(const TeamName& team, const TeamStanding& standing) {
    if (team.empty()) {
        return invalid(team, "empty team name");
    }
    if (standing.matches < 0) {
        return invalid(team, "negative matches played");
    }
    if (standing.goalsFor < 0 || standing.goalsAgainst < 0) {
        return invalid(team, "negative goal count");
    }
    if (standing.draws < 0 || standing.draws > standing.matches) {
        return invalid(team, "draws outside [0, M]");
    }
    if (standing.goalDifference != standing.goalsFor - standing.goalsAgainst) {
        return invalid(team, "GD != GF - GA (GD=" + std::to_string(standing.goalDifference) +
                                 ", GF=" + std::to_string(standing.goalsFor) +
                                 ", GA=" + std::to_string(standing.goalsAgainst) + ")");
    }
    return SimResult<void>::ok();
}

SimResult<void> validateStandings(const Standings& standings) {
    if (standings.empty()) {
        return SimResult<void>::err(SimError(ErrorCode::EmptyStandings, "standings table is empty"));
    }
    for (const auto& [team, standing] : standings) {
        auto checked = validateStanding(team, standing);
        if (!checked) {
            return checked;
        }
    }
    return SimResult<void>::ok();
}

} // namespace lsim::model
