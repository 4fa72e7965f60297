#pragma once

/// @file simulator_config.hpp
/// @brief Typed simulator settings loaded from ConfigManager.

#include <cstdint>

#include "lsim/foundation/config_manager.hpp"
#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/elo_updater.hpp"
#include "lsim/model/league_goal_model.hpp"
#include "lsim/model/rating_initializer.hpp"
#include "lsim/simulation/goal_simulator.hpp"

namespace lsim::season {

/// All tunables of a season simulation.
///
/// | Key                       | Field                          | Default      |
/// |---------------------------|--------------------------------|--------------|
/// | rating.alpha              | ratingWeights.alpha            | 1.0          |
/// | rating.beta               | ratingWeights.beta             | 0.8          |
/// | rating.gamma              | ratingWeights.gamma            | 0.2          |
/// | rating.sigma              | ratingWeights.sigma            | 100.0        |
/// | elo.k_factor              | kFactor                        | 20.0         |
/// | goals.strategy            | goals.strategy                 | hybrid       |
/// | goals.base_lambda         | goals.elo.baseLambda           | 1.5          |
/// | goals.use_elo             | goals.hybrid.useElo            | true         |
/// | goals.elo_factor          | goals.hybrid.eloFactor         | 800.0        |
/// | goals.draw_bias           | goals.hybrid.drawBias          | 0.1          |
/// | goals.zero_games_policy   | goalModel.zeroGamesPolicy      | impute_mean  |
/// | goals.normalize           | goalModel.normalize            | true         |
/// | season.rebuild_interval   | rebuildInterval                | 0            |
/// | random.seed               | seed                           | 42           |
struct SimulatorConfig {
    model::RatingWeights ratingWeights;
    double kFactor = model::EloUpdater::kDefaultKFactor;
    simulation::GoalSimulatorConfig goals;
    model::GoalModelOptions goalModel;

    /// Fixtures between goal-model rebuilds from running counters; 0 = never.
    uint32_t rebuildInterval = 0;

    uint64_t seed = 42;
};

/// Read a SimulatorConfig; absent keys keep their defaults.
///
/// @return The config, or ConfigTypeMismatch / ConfigValueInvalid.
[[nodiscard]] foundation::SimResult<SimulatorConfig> loadSimulatorConfig(
    const foundation::ConfigManager& config);

/// Range checks shared by the loader and SeasonSimulator::create.
[[nodiscard]] foundation::SimResult<void> validateSimulatorConfig(const SimulatorConfig& config);

} // namespace lsim::season
