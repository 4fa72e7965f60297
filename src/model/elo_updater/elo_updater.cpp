/// @file elo_updater.cpp
/// @brief EloUpdater implementation.

#include "lsim/model/elo_updater.hpp"

#include <string>

#include "lsim/model/outcome_probability.hpp"

namespace lsim::model {

using foundation::ErrorCode;
using foundation::SimError;
using foundation::SimResult;

EloPair EloUpdater::updateElo(double eloA, double eloB,
                              double scoreA, double scoreB,
                              double kFactor) {
    double expectedA = OutcomeProbability::expectedScore(eloA, eloB);
    double expectedB = 1.0 - expectedA;
    return EloPair{eloA + kFactor * (scoreA - expectedA),
                   eloB + kFactor * (scoreB - expectedB)};
}

SimResult<EloPair> EloUpdater::applyResult(RatingTable& ratings,
                                           const TeamName& teamA,
                                           const TeamName& teamB,
                                           const OutcomeScore& outcome,
                                           double kFactor) {
    if (teamA == teamB) {
        return SimResult<EloPair>::err(
            SimError(ErrorCode::InvalidArgument, "team '" + teamA + "' cannot play itself"));
    }
    auto eloA = lookupTeam(ratings, teamA, "rating table");
    if (!eloA) {
        return SimResult<EloPair>::err(eloA.error());
    }
    auto eloB = lookupTeam(ratings, teamB, "rating table");
    if (!eloB) {
        return SimResult<EloPair>::err(eloB.error());
    }

    auto updated = updateElo(eloA.value(), eloB.value(),
                             outcome.scoreA, outcome.scoreB, kFactor);
    ratings[teamA] = updated.eloA;
    ratings[teamB] = updated.eloB;
    return SimResult<EloPair>::ok(updated);
}

} // namespace lsim::model
