#pragma once

/// @file goal_simulator.hpp
/// @brief Match score sampling strategies behind one interface.
///
/// Two strategies draw independent Poisson goal counts:
///   - EloPoissonSimulator: expected goals from the rating gap alone.
///   - HybridPoissonSimulator: attack/defense multipliers, optional Elo
///     correction, and a post-hoc draw bias.

#include <cstdint>
#include <memory>
#include <string_view>

#include "lsim/foundation/sim_result.hpp"
#include "lsim/model/league_types.hpp"
#include "lsim/simulation/random_source.hpp"

namespace lsim::simulation {

/// Inputs for one fixture. Pointers are non-owning and may be null when a
/// strategy does not need them.
struct MatchContext {
    model::TeamName teamA;
    model::TeamName teamB;
    const model::RatingTable* ratings = nullptr;
    const model::GoalModel* goalModel = nullptr;
};

/// Expected goals above this per side are rejected as InvalidExpectedGoals.
inline constexpr double kMaxExpectedGoals = 100.0;

/// Poisson means for both sides.
struct ExpectedGoals {
    double goalsA = 0.0;
    double goalsB = 0.0;
};

enum class GoalStrategy : uint8_t {
    EloPoisson,
    Hybrid
};

[[nodiscard]] std::string_view goalStrategyName(GoalStrategy strategy);

/// Parse "elo" / "hybrid".
[[nodiscard]] foundation::SimResult<GoalStrategy> parseGoalStrategy(std::string_view name);

struct EloPoissonParams {
    double baseLambda = 1.5;  ///< League goals per team per match.
    double eloScale = 800.0;  ///< Rating gap giving a 10x goal ratio. Must be > 0.
};

struct HybridPoissonParams {
    bool useElo = true;        ///< Apply the Elo correction when ratings are given.
    double eloFactor = 800.0;  ///< Divisor of the rating gap in the correction. Must be > 0.
    double drawBias = 0.1;     ///< Probability of forcing a decisive score level.
};

struct GoalSimulatorConfig {
    GoalStrategy strategy = GoalStrategy::Hybrid;
    EloPoissonParams elo;
    HybridPoissonParams hybrid;
};

/// expA = baseLambda * 10^((eloA - eloB) / scale), expB symmetric.
[[nodiscard]] ExpectedGoals expectedGoalsElo(double eloA, double eloB,
                                             double baseLambda, double scale = 800.0);

/// expA = baseLambda * attackA * defenseB, expB = baseLambda * attackB * defenseA.
[[nodiscard]] ExpectedGoals expectedGoalsHybrid(double baseLambda,
                                                double attackA, double defenseA,
                                                double attackB, double defenseB);

/// Multiply expA and divide expB by 10^((eloA - eloB) / eloFactor).
[[nodiscard]] ExpectedGoals applyEloCorrection(const ExpectedGoals& goals,
                                               double eloA, double eloB,
                                               double eloFactor);

/// Capability interface: sample one final score.
class IGoalSimulator {
public:
    virtual ~IGoalSimulator() = default;

    /// @return The sampled score, or MissingInput / TeamNotFound /
    ///         InvalidExpectedGoals / InvalidArgument.
    [[nodiscard]] virtual foundation::SimResult<model::Scoreline> simulate(
        const MatchContext& ctx, RandomSource& random) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Rating-only Poisson model. Requires ctx.ratings.
class EloPoissonSimulator final : public IGoalSimulator {
public:
    explicit EloPoissonSimulator(EloPoissonParams params = {}) : params_(params) {}

    [[nodiscard]] foundation::SimResult<model::Scoreline> simulate(
        const MatchContext& ctx, RandomSource& random) const override;

    [[nodiscard]] std::string_view name() const override { return "elo"; }

    [[nodiscard]] const EloPoissonParams& params() const noexcept { return params_; }

private:
    EloPoissonParams params_;
};

/// Attack/defense Poisson model with optional Elo correction and draw bias.
/// Requires ctx.goalModel; ctx.ratings enables the Elo correction.
///
/// After sampling, a decisive score is turned into a draw with probability
/// drawBias, both sides getting max(0, round((a + b) / 2)). This offsets
/// the independent-Poisson shortfall of draws.
class HybridPoissonSimulator final : public IGoalSimulator {
public:
    explicit HybridPoissonSimulator(HybridPoissonParams params = {}) : params_(params) {}

    [[nodiscard]] foundation::SimResult<model::Scoreline> simulate(
        const MatchContext& ctx, RandomSource& random) const override;

    [[nodiscard]] std::string_view name() const override { return "hybrid"; }

    [[nodiscard]] const HybridPoissonParams& params() const noexcept { return params_; }

private:
    HybridPoissonParams params_;
};

/// Build the configured strategy after validating its parameters.
///
/// @return The simulator or InvalidArgument.
[[nodiscard]] foundation::SimResult<std::unique_ptr<IGoalSimulator>> createGoalSimulator(
    const GoalSimulatorConfig& config);

} // namespace lsim::simulation
