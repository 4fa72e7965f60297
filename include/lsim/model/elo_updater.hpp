#pragma once

/// @file elo_updater.hpp
/// @brief Elo rating adjustment after an observed result.

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"

namespace lsim::model {

/// Static utility applying the Elo update rule
///   R' = R + K * (actual - expected)
/// with the expected score from OutcomeProbability::expectedScore.
class EloUpdater {
public:
    EloUpdater() = delete;

    static constexpr double kDefaultKFactor = 20.0;

    /// Updated ratings for both sides. Pure; nothing is written back.
    [[nodiscard]] static EloPair updateElo(double eloA, double eloB,
                                           double scoreA, double scoreB,
                                           double kFactor = kDefaultKFactor);

    /// Update both teams' ratings in place.
    ///
    /// The table is left untouched when either team is missing.
    ///
    /// @return The new ratings, or TeamNotFound / InvalidArgument
    ///         (teamA == teamB).
    [[nodiscard]] static foundation::SimResult<EloPair> applyResult(
        RatingTable& ratings,
        const TeamName& teamA,
        const TeamName& teamB,
        const OutcomeScore& outcome,
        double kFactor = kDefaultKFactor);
};

} // namespace lsim::model
