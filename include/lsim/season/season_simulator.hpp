#pragma once

/// @file season_simulator.hpp
/// @brief Fixture-by-fixture season simulation with rating feedback.

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"
#include "lsim/season/simulator_config.hpp"
#include "lsim/simulation/goal_simulator.hpp"
#include "lsim/simulation/random_source.hpp"

namespace lsim::season {

/// One scheduled match, A against B.
struct Fixture {
    model::TeamName teamA;
    model::TeamName teamB;
};

/// Everything observed while resolving one fixture.
struct MatchRecord {
    Fixture fixture;
    uint64_t index = 0;                       ///< 0-based position in the season.
    model::EloPair ratingsBefore;
    model::MatchProbabilities probabilities;  ///< Pre-match, from ratingsBefore.
    model::Scoreline score;
    model::OutcomeScore outcome;
    model::EloPair ratingsAfter;
};

/// Owns the mutable state of one simulated season.
///
/// Each fixture is one step, applied in the order given:
///   1. read both ratings and compute pre-match probabilities
///   2. sample a score with the configured goal strategy
///   3. classify the score and apply the Elo update
///   4. accumulate running counters and refresh the draw rate
///   5. every rebuildInterval fixtures, rebuild the goal model from the
///      running counters (a degenerate rebuild keeps the previous model)
/// A fixture that fails leaves the season state unchanged.
class SeasonSimulator {
public:
    /// Validate the standings and config, then derive ratings, goal model,
    /// draw rate and running counters from the snapshot.
    ///
    /// The Elo strategy takes its base lambda from the standings when any
    /// match has been played, and from the config otherwise. It also
    /// accepts a snapshot whose goal model is degenerate; the hybrid
    /// strategy fails with DegenerateLeague.
    [[nodiscard]] static foundation::SimResult<SeasonSimulator> create(
        const model::Standings& standings,
        const SimulatorConfig& config);

    /// Resolve one fixture.
    ///
    /// @return The record, or InvalidArgument / TeamNotFound / any
    ///         sampling or model-rebuild error.
    [[nodiscard]] foundation::SimResult<MatchRecord> playFixture(
        const Fixture& fixture, simulation::RandomSource& random);

    /// Resolve fixtures in order, stopping at the first error.
    ///
    /// On error the records of the fixtures already resolved are not
    /// returned, but their rating and counter updates stay applied. Compare
    /// fixturesPlayed() before and after the call to count them.
    [[nodiscard]] foundation::SimResult<std::vector<MatchRecord>> playFixtures(
        const std::vector<Fixture>& fixtures, simulation::RandomSource& random);

    /// Rebuild the goal model from the current running counters.
    foundation::SimResult<void> rebuildGoalModel();

    [[nodiscard]] const model::RatingTable& ratings() const noexcept { return ratings_; }
    [[nodiscard]] const model::GoalModel& goalModel() const noexcept { return goalModel_; }
    [[nodiscard]] const model::RunningCounters& counters() const noexcept { return counters_; }
    [[nodiscard]] double drawProbability() const noexcept { return drawProb_; }
    [[nodiscard]] uint64_t fixturesPlayed() const noexcept { return fixturesPlayed_; }
    [[nodiscard]] const SimulatorConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::string_view strategyName() const { return simulator_->name(); }

private:
    SeasonSimulator(SimulatorConfig config,
                    model::RatingTable ratings,
                    model::GoalModel goalModel,
                    model::RunningCounters counters,
                    std::unique_ptr<simulation::IGoalSimulator> simulator);

    static void accumulate(model::RunningCounters& counters,
                           const Fixture& fixture,
                           const model::Scoreline& score);

    SimulatorConfig config_;
    model::RatingTable ratings_;
    model::GoalModel goalModel_;
    model::RunningCounters counters_;
    double drawProb_ = 0.0;
    uint64_t fixturesPlayed_ = 0;
    std::unique_ptr<simulation::IGoalSimulator> simulator_;
};

} // namespace lsim::season
