#pragma once

/// @file outcome_probability.hpp
/// @brief Win/draw/loss probabilities from an Elo rating pair.

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"

namespace lsim::model {

/// Static utility for Elo-based outcome probabilities.
///
/// Uses the standard Elo formula:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
///
/// The draw probability is a league-wide constant supplied by the caller;
/// it does not depend on the rating gap.
class OutcomeProbability {
public:
    OutcomeProbability() = delete;

    /// Rating difference that gives 10:1 expected-score odds.
    static constexpr double kEloScale = 400.0;

    /// Expected score of A against B, in (0, 1).
    [[nodiscard]] static double expectedScore(double eloA, double eloB);

    /// Split the non-draw mass by the expected score and renormalize.
    ///
    ///   winA = (1 - d) * E(A), draw = d, winB = (1 - d) * (1 - E(A))
    ///
    /// @param drawProb League draw rate in [0, 1].
    /// @return Probabilities summing to 1, or InvalidArgument (non-finite
    ///         rating) / InvalidProbability (drawProb outside [0, 1]).
    [[nodiscard]] static foundation::SimResult<MatchProbabilities> matchProbs(
        double eloA, double eloB, double drawProb);
};

} // namespace lsim::model
