#pragma once

/// @file rating_initializer.hpp
/// @brief Initial Elo ratings derived from league standings.

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"

namespace lsim::model {

/// Weights of the raw skill score and the spread of the resulting ratings.
struct RatingWeights {
    double alpha = 1.0;    ///< Weight of points per game.
    double beta = 0.8;     ///< Weight of goal difference per game.
    double gamma = 0.2;    ///< Weight of goals for per game.
    double sigma = 100.0;  ///< Rating points per standard deviation of skill.
};

/// Static utility deriving a RatingTable from a standings snapshot.
///
/// Each team gets a raw skill score
///   S = alpha * Pts/M + beta * GD/M + gamma * GF/M
/// which is standardized across the league (population mean and standard
/// deviation) and mapped to round(1500 + sigma * z).
class RatingInitializer {
public:
    RatingInitializer() = delete;

    /// Centre of the rating scale.
    static constexpr double kBaseRating = 1500.0;

    /// Raw skill score of one team. M <= 0 is treated as 1.
    [[nodiscard]] static double skillScore(const TeamStanding& standing,
                                           const RatingWeights& weights);

    /// Compute initial ratings for every team in the table.
    ///
    /// A zero standard deviation (all teams identical) is treated as 1, so
    /// every team gets exactly kBaseRating. Ratings are rounded to the
    /// nearest integer, ties to even.
    ///
    /// @return Ratings, or EmptyStandings / InvalidStanding / InvalidArgument.
    [[nodiscard]] static foundation::SimResult<RatingTable> computeAutoElo(
        const Standings& standings,
        const RatingWeights& weights = {});
};

} // namespace lsim::model
