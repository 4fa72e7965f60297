/// @file outcome_probability.cpp
/// @brief OutcomeProbability implementation.

#include "lsim/model/outcome_probability.hpp"

#include <cmath>
#include <string>

namespace lsim::model {

using foundation::ErrorCode;
using foundation::SimError;
using foundation::SimResult;

double OutcomeProbability::expectedScore(double eloA, double eloB) {
    double exponent = (eloB - eloA) / kEloScale;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

SimResult<MatchProbabilities> OutcomeProbability::matchProbs(double eloA, double eloB,
                                                             double drawProb) {
    if (!std::isfinite(eloA) || !std::isfinite(eloB)) {
        return SimResult<MatchProbabilities>::err(
            SimError(ErrorCode::InvalidArgument, "ratings must be finite"));
    }
    if (!std::isfinite(drawProb) || drawProb < 0.0 || drawProb > 1.0) {
        return SimResult<MatchProbabilities>::err(SimError(
            ErrorCode::InvalidProbability,
            "draw probability outside [0, 1]: " + std::to_string(drawProb)));
    }

    double expectedA = expectedScore(eloA, eloB);
    MatchProbabilities probs;
    probs.draw = drawProb;
    probs.winA = (1.0 - drawProb) * expectedA;
    probs.winB = (1.0 - drawProb) * (1.0 - expectedA);

    // Renormalize against floating-point drift.
    double total = probs.winA + probs.draw + probs.winB;
    probs.winA /= total;
    probs.draw /= total;
    probs.winB /= total;
    return SimResult<MatchProbabilities>::ok(probs);
}

} // namespace lsim::model
