/// @file simulator_config.cpp
/// @brief SimulatorConfig loading and validation.

#include "lsim/season/simulator_config.hpp"

#include <cmath>
#include <string>

#include "lsim/foundation/sim_logger.hpp"

namespace lsim::season {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;
using foundation::SimResult;

namespace {

/// Overwrite `out` when the key is present; a wrong type is an error.
template <typename T>
SimResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return SimResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return SimResult<void>::err(value.error());
    }
    out = value.value();
    return SimResult<void>::ok();
}

SimResult<void> invalidValue(const std::string& message) {
    return SimResult<void>::err(SimError(ErrorCode::ConfigValueInvalid, message));
}

} // namespace

SimResult<void> validateSimulatorConfig(const SimulatorConfig& config) {
    const auto& w = config.ratingWeights;
    if (!std::isfinite(w.alpha) || !std::isfinite(w.beta) || !std::isfinite(w.gamma)) {
        return invalidValue("rating weights must be finite");
    }
    if (!std::isfinite(w.sigma) || w.sigma < 0.0) {
        return invalidValue("rating.sigma must be finite and non-negative");
    }
    if (!std::isfinite(config.kFactor) || config.kFactor < 0.0) {
        return invalidValue("elo.k_factor must be finite and non-negative");
    }
    if (!std::isfinite(config.goals.elo.baseLambda) || config.goals.elo.baseLambda <= 0.0) {
        return invalidValue("goals.base_lambda must be positive");
    }
    if (!std::isfinite(config.goals.hybrid.eloFactor) || config.goals.hybrid.eloFactor <= 0.0) {
        return invalidValue("goals.elo_factor must be finite and positive");
    }
    double bias = config.goals.hybrid.drawBias;
    if (!std::isfinite(bias) || bias < 0.0 || bias > 1.0) {
        return invalidValue("goals.draw_bias must lie in [0, 1]");
    }
    return SimResult<void>::ok();
}

SimResult<SimulatorConfig> loadSimulatorConfig(const ConfigManager& config) {
    SimulatorConfig out;
    std::string strategy(simulation::goalStrategyName(out.goals.strategy));
    std::string policy(model::zeroGamesPolicyName(out.goalModel.zeroGamesPolicy));
    int64_t rebuildInterval = out.rebuildInterval;
    uint64_t seed = out.seed;

    for (auto read : {readOptional(config, "rating.alpha", out.ratingWeights.alpha),
                      readOptional(config, "rating.beta", out.ratingWeights.beta),
                      readOptional(config, "rating.gamma", out.ratingWeights.gamma),
                      readOptional(config, "rating.sigma", out.ratingWeights.sigma),
                      readOptional(config, "elo.k_factor", out.kFactor),
                      readOptional(config, "goals.strategy", strategy),
                      readOptional(config, "goals.base_lambda", out.goals.elo.baseLambda),
                      readOptional(config, "goals.use_elo", out.goals.hybrid.useElo),
                      readOptional(config, "goals.elo_factor", out.goals.hybrid.eloFactor),
                      readOptional(config, "goals.draw_bias", out.goals.hybrid.drawBias),
                      readOptional(config, "goals.zero_games_policy", policy),
                      readOptional(config, "goals.normalize", out.goalModel.normalize),
                      readOptional(config, "season.rebuild_interval", rebuildInterval),
                      readOptional(config, "random.seed", seed)}) {
        if (!read) {
            LSIM_LOG_ERROR(LogCategory::Config, std::string(read.error().message()));
            return SimResult<SimulatorConfig>::err(read.error());
        }
    }

    auto parsedStrategy = simulation::parseGoalStrategy(strategy);
    if (!parsedStrategy) {
        return SimResult<SimulatorConfig>::err(
            SimError(ErrorCode::ConfigValueInvalid, std::string(parsedStrategy.error().message())));
    }
    out.goals.strategy = parsedStrategy.value();

    auto parsedPolicy = model::parseZeroGamesPolicy(policy);
    if (!parsedPolicy) {
        return SimResult<SimulatorConfig>::err(
            SimError(ErrorCode::ConfigValueInvalid, std::string(parsedPolicy.error().message())));
    }
    out.goalModel.zeroGamesPolicy = parsedPolicy.value();

    if (rebuildInterval < 0 || rebuildInterval > UINT32_MAX) {
        return SimResult<SimulatorConfig>::err(SimError(
            ErrorCode::ConfigValueInvalid, "season.rebuild_interval out of range"));
    }
    out.rebuildInterval = static_cast<uint32_t>(rebuildInterval);
    out.seed = seed;

    auto valid = validateSimulatorConfig(out);
    if (!valid) {
        LSIM_LOG_ERROR(LogCategory::Config, std::string(valid.error().message()));
        return SimResult<SimulatorConfig>::err(valid.error());
    }

    LSIM_LOG_INFO(LogCategory::Config,
                  "simulator config loaded (strategy " + strategy + ", K " +
                      std::to_string(out.kFactor) + ", seed " + std::to_string(out.seed) + ")");
    return SimResult<SimulatorConfig>::ok(out);
}

} // namespace lsim::season
