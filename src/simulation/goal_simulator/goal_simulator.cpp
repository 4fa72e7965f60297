/// @file goal_simulator.cpp
/// @brief Goal sampling strategies and factory.

#include "lsim/simulation/goal_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "lsim/foundation/sim_logger.hpp"

namespace lsim::simulation {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogLevel;
using foundation::SimError;
using foundation::SimResult;
using model::Scoreline;

namespace {

SimResult<Scoreline> missingInput(std::string_view strategy, std::string_view what) {
    return SimResult<Scoreline>::err(SimError(
        ErrorCode::MissingInput,
        std::string(strategy) + " simulator requires " + std::string(what)));
}

SimResult<void> checkExpectedGoals(const ExpectedGoals& goals) {
    if (!std::isfinite(goals.goalsA) || !std::isfinite(goals.goalsB) ||
        goals.goalsA < 0.0 || goals.goalsB < 0.0 ||
        goals.goalsA > kMaxExpectedGoals || goals.goalsB > kMaxExpectedGoals) {
        return SimResult<void>::err(SimError(
            ErrorCode::InvalidExpectedGoals,
            "expected goals must lie in [0, " + std::to_string(kMaxExpectedGoals) + "] (got " +
                std::to_string(goals.goalsA) + ", " + std::to_string(goals.goalsB) + ")",
            goals));
    }
    return SimResult<void>::ok();
}

SimResult<void> checkTeams(const MatchContext& ctx) {
    if (ctx.teamA == ctx.teamB) {
        return SimResult<void>::err(SimError(
            ErrorCode::InvalidArgument, "team '" + ctx.teamA + "' cannot play itself"));
    }
    return SimResult<void>::ok();
}

SimResult<ExpectedGoals> hybridGoals(const model::GoalModel& gm, const MatchContext& ctx) {
    auto attackA = model::lookupTeam(gm.attack, ctx.teamA, "attack multipliers");
    if (!attackA) {
        return SimResult<ExpectedGoals>::err(attackA.error());
    }
    auto defenseA = model::lookupTeam(gm.defense, ctx.teamA, "defense multipliers");
    if (!defenseA) {
        return SimResult<ExpectedGoals>::err(defenseA.error());
    }
    auto attackB = model::lookupTeam(gm.attack, ctx.teamB, "attack multipliers");
    if (!attackB) {
        return SimResult<ExpectedGoals>::err(attackB.error());
    }
    auto defenseB = model::lookupTeam(gm.defense, ctx.teamB, "defense multipliers");
    if (!defenseB) {
        return SimResult<ExpectedGoals>::err(defenseB.error());
    }
    return SimResult<ExpectedGoals>::ok(expectedGoalsHybrid(
        gm.baseLambda, attackA.value(), defenseA.value(), attackB.value(), defenseB.value()));
}

Scoreline samplePair(const ExpectedGoals& goals, RandomSource& random) {
    Scoreline score;
    score.goalsA = random.samplePoisson(goals.goalsA);
    score.goalsB = random.samplePoisson(goals.goalsB);
    return score;
}

void traceSample(std::string_view strategy, const MatchContext& ctx,
                 const ExpectedGoals& goals, const Scoreline& score) {
    LSIM_LOG(LogLevel::Trace, LogCategory::Simulation,
             std::string(strategy) + " " + ctx.teamA + " vs " + ctx.teamB +
                 ": xG " + std::to_string(goals.goalsA) + "-" + std::to_string(goals.goalsB) +
                 " -> " + std::to_string(score.goalsA) + "-" + std::to_string(score.goalsB));
}

} // namespace

std::string_view goalStrategyName(GoalStrategy strategy) {
    switch (strategy) {
        case GoalStrategy::EloPoisson: return "elo";
        case GoalStrategy::Hybrid:     return "hybrid";
    }
    return "unknown";
}

SimResult<GoalStrategy> parseGoalStrategy(std::string_view name) {
    if (name == "elo") {
        return SimResult<GoalStrategy>::ok(GoalStrategy::EloPoisson);
    }
    if (name == "hybrid") {
        return SimResult<GoalStrategy>::ok(GoalStrategy::Hybrid);
    }
    return SimResult<GoalStrategy>::err(SimError(
        ErrorCode::InvalidArgument, "unknown goal strategy: " + std::string(name)));
}

ExpectedGoals expectedGoalsElo(double eloA, double eloB, double baseLambda, double scale) {
    return ExpectedGoals{baseLambda * std::pow(10.0, (eloA - eloB) / scale),
                         baseLambda * std::pow(10.0, (eloB - eloA) / scale)};
}

ExpectedGoals expectedGoalsHybrid(double baseLambda,
                                  double attackA, double defenseA,
                                  double attackB, double defenseB) {
    return ExpectedGoals{baseLambda * attackA * defenseB,
                         baseLambda * attackB * defenseA};
}

ExpectedGoals applyEloCorrection(const ExpectedGoals& goals,
                                 double eloA, double eloB, double eloFactor) {
    double factor = std::pow(10.0, (eloA - eloB) / eloFactor);
    return ExpectedGoals{goals.goalsA * factor, goals.goalsB / factor};
}

// ── EloPoissonSimulator ─────────────────────────────────────────────────

SimResult<Scoreline> EloPoissonSimulator::simulate(const MatchContext& ctx,
                                                   RandomSource& random) const {
    if (ctx.ratings == nullptr) {
        return missingInput(name(), "a rating table");
    }
    auto teams = checkTeams(ctx);
    if (!teams) {
        return SimResult<Scoreline>::err(teams.error());
    }
    auto eloA = model::lookupTeam(*ctx.ratings, ctx.teamA, "rating table");
    if (!eloA) {
        return SimResult<Scoreline>::err(eloA.error());
    }
    auto eloB = model::lookupTeam(*ctx.ratings, ctx.teamB, "rating table");
    if (!eloB) {
        return SimResult<Scoreline>::err(eloB.error());
    }

    auto goals = expectedGoalsElo(eloA.value(), eloB.value(),
                                  params_.baseLambda, params_.eloScale);
    auto checked = checkExpectedGoals(goals);
    if (!checked) {
        return SimResult<Scoreline>::err(checked.error());
    }

    auto score = samplePair(goals, random);
    traceSample(name(), ctx, goals, score);
    return SimResult<Scoreline>::ok(score);
}

// ── HybridPoissonSimulator ──────────────────────────────────────────────

SimResult<Scoreline> HybridPoissonSimulator::simulate(const MatchContext& ctx,
                                                      RandomSource& random) const {
    if (ctx.goalModel == nullptr) {
        return missingInput(name(), "a goal model");
    }
    if (!std::isfinite(params_.drawBias) || params_.drawBias < 0.0 || params_.drawBias > 1.0) {
        return SimResult<Scoreline>::err(SimError(
            ErrorCode::InvalidArgument, "draw bias outside [0, 1]"));
    }
    if (!std::isfinite(params_.eloFactor) || params_.eloFactor <= 0.0) {
        return SimResult<Scoreline>::err(SimError(
            ErrorCode::InvalidArgument, "Elo factor must be finite and positive"));
    }
    auto teams = checkTeams(ctx);
    if (!teams) {
        return SimResult<Scoreline>::err(teams.error());
    }

    auto modelGoals = hybridGoals(*ctx.goalModel, ctx);
    if (!modelGoals) {
        return SimResult<Scoreline>::err(modelGoals.error());
    }
    auto goals = modelGoals.value();

    if (params_.useElo && ctx.ratings != nullptr) {
        auto eloA = model::lookupTeam(*ctx.ratings, ctx.teamA, "rating table");
        if (!eloA) {
            return SimResult<Scoreline>::err(eloA.error());
        }
        auto eloB = model::lookupTeam(*ctx.ratings, ctx.teamB, "rating table");
        if (!eloB) {
            return SimResult<Scoreline>::err(eloB.error());
        }
        goals = applyEloCorrection(goals, eloA.value(), eloB.value(), params_.eloFactor);
    }

    auto checked = checkExpectedGoals(goals);
    if (!checked) {
        return SimResult<Scoreline>::err(checked.error());
    }

    auto score = samplePair(goals, random);

    if (score.goalsA != score.goalsB && params_.drawBias > 0.0 &&
        random.bernoulli(params_.drawBias)) {
        double mid = std::nearbyint((score.goalsA + score.goalsB) / 2.0);
        auto level = static_cast<int32_t>(std::max(0.0, mid));
        score.goalsA = level;
        score.goalsB = level;
    }

    traceSample(name(), ctx, goals, score);
    return SimResult<Scoreline>::ok(score);
}

// ── Factory ─────────────────────────────────────────────────────────────

SimResult<std::unique_ptr<IGoalSimulator>> createGoalSimulator(const GoalSimulatorConfig& config) {
    using Ptr = std::unique_ptr<IGoalSimulator>;

    switch (config.strategy) {
        case GoalStrategy::EloPoisson: {
            const auto& p = config.elo;
            if (!std::isfinite(p.baseLambda) || p.baseLambda <= 0.0) {
                return SimResult<Ptr>::err(SimError(
                    ErrorCode::InvalidArgument, "Elo strategy base lambda must be positive"));
            }
            if (!std::isfinite(p.eloScale) || p.eloScale <= 0.0) {
                return SimResult<Ptr>::err(SimError(
                    ErrorCode::InvalidArgument, "Elo goal scale must be finite and positive"));
            }
            return SimResult<Ptr>::ok(std::make_unique<EloPoissonSimulator>(p));
        }
        case GoalStrategy::Hybrid: {
            const auto& p = config.hybrid;
            if (!std::isfinite(p.eloFactor) || p.eloFactor <= 0.0) {
                return SimResult<Ptr>::err(SimError(
                    ErrorCode::InvalidArgument, "Elo factor must be finite and positive"));
            }
            if (!std::isfinite(p.drawBias) || p.drawBias < 0.0 || p.drawBias > 1.0) {
                return SimResult<Ptr>::err(SimError(
                    ErrorCode::InvalidArgument, "draw bias outside [0, 1]"));
            }
            return SimResult<Ptr>::ok(std::make_unique<HybridPoissonSimulator>(p));
        }
    }
    return SimResult<Ptr>::err(SimError(ErrorCode::InvalidArgument, "unknown goal strategy"));
}

} // namespace lsim::simulation
