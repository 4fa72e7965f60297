/// @file rating_initializer.cpp
/// @brief RatingInitializer implementation.

#include "lsim/model/rating_initializer.hpp"

#include <cmath>
#include <string>

#include "lsim/foundation/sim_logger.hpp"
#include "lsim/model/standings_validator.hpp"

namespace lsim::model {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;
using foundation::SimResult;

double RatingInitializer::skillScore(const TeamStanding& standing,
                                     const RatingWeights& weights) {
    double m = standing.matches <= 0 ? 1.0 : static_cast<double>(standing.matches);
    double ppg = static_cast<double>(standing.points) / m;
    double gdPerGame = static_cast<double>(standing.goalDifference) / m;
    double gfPerGame = static_cast<double>(standing.goalsFor) / m;
    return weights.alpha * ppg + weights.beta * gdPerGame + weights.gamma * gfPerGame;
}

SimResult<RatingTable> RatingInitializer::computeAutoElo(const Standings& standings,
                                                         const RatingWeights& weights) {
    if (!std::isfinite(weights.alpha) || !std::isfinite(weights.beta) ||
        !std::isfinite(weights.gamma) || !std::isfinite(weights.sigma)) {
        return SimResult<RatingTable>::err(
            SimError(ErrorCode::InvalidArgument, "rating weights must be finite"));
    }
    auto valid = validateStandings(standings);
    if (!valid) {
        return SimResult<RatingTable>::err(valid.error());
    }

    TeamValues scores;
    double sum = 0.0;
    for (const auto& [team, standing] : standings) {
        double s = skillScore(standing, weights);
        scores.emplace(team, s);
        sum += s;
    }

    auto n = static_cast<double>(scores.size());
    double mean = sum / n;

    double sqSum = 0.0;
    for (const auto& [team, s] : scores) {
        double diff = s - mean;
        sqSum += diff * diff;
    }
    double stddev = std::sqrt(sqSum / n);
    if (stddev == 0.0) {
        LSIM_LOG_WARN(LogCategory::Rating,
                      "skill scores have zero spread; all teams start at base rating");
        stddev = 1.0;
    }

    RatingTable ratings;
    for (const auto& [team, s] : scores) {
        double z = (s - mean) / stddev;
        ratings.emplace(team, std::nearbyint(kBaseRating + weights.sigma * z));
    }

    LSIM_LOG_DEBUG(LogCategory::Rating,
                   "initialized " + std::to_string(ratings.size()) +
                       " ratings (skill mean " + std::to_string(mean) +
                       ", std " + std::to_string(stddev) + ")");
    return SimResult<RatingTable>::ok(std::move(ratings));
}

} // namespace lsim::model
