/// @file league_goal_model.cpp
/// @brief LeagueGoalModel implementation.
///
/// Both entry points reduce to the same per-team rate computation:
///   1. goals-for / goals-against per game (zero-games guard applied)
///   2. baseLambda = mean goals-for per game
///   3. attack = gfRate / baseLambda, defense = gaRate / baseLambda
///   4. optional per-map mean normalization

#include "lsim/model/league_goal_model.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "lsim/foundation/sim_logger.hpp"
#include "lsim/model/standings_validator.hpp"

namespace lsim::model {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;
using foundation::SimResult;

namespace {

double meanOf(const TeamValues& values) {
    double sum = 0.0;
    for (const auto& [team, v] : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

SimResult<void> checkCounter(const TeamName& team, double value, std::string_view what) {
    if (!std::isfinite(value) || value < 0.0) {
        return SimResult<void>::err(SimError(
            ErrorCode::InvalidStanding,
            std::string(what) + " for '" + team + "' must be finite and non-negative",
            team));
    }
    return SimResult<void>::ok();
}

/// Fill the rate of every team listed in `idle` with the mean of the rest.
void imputeMean(TeamValues& rates, const std::vector<TeamName>& idle) {
    double sum = 0.0;
    std::size_t played = 0;
    for (const auto& [team, rate] : rates) {
        if (std::find(idle.begin(), idle.end(), team) == idle.end()) {
            sum += rate;
            ++played;
        }
    }
    double fill = sum / static_cast<double>(played);
    for (const auto& team : idle) {
        rates[team] = fill;
    }
}

SimResult<GoalModel> buildModel(const RunningCounters& counters, const GoalModelOptions& options) {
    TeamValues gfRate;
    TeamValues gaRate;
    std::vector<TeamName> idle;

    for (const auto& [team, games] : counters.gamesPlayed) {
        double gf = counters.goalsFor.at(team);
        double ga = counters.goalsAgainst.at(team);
        if (games > 0.0) {
            gfRate[team] = gf / games;
            gaRate[team] = ga / games;
        } else {
            gfRate[team] = 0.0;
            gaRate[team] = 0.0;
            idle.push_back(team);
        }
    }

    if (!idle.empty()) {
        LSIM_LOG_WARN(LogCategory::GoalModel,
                      std::to_string(idle.size()) + " team(s) with zero games; policy " +
                          std::string(zeroGamesPolicyName(options.zeroGamesPolicy)));
        if (options.zeroGamesPolicy == ZeroGamesPolicy::ImputeLeagueMean) {
            if (idle.size() == gfRate.size()) {
                return SimResult<GoalModel>::err(SimError(
                    ErrorCode::DegenerateLeague, "no team has played; league mean rate undefined"));
            }
            imputeMean(gfRate, idle);
            imputeMean(gaRate, idle);
        }
    }

    GoalModel model;
    model.baseLambda = meanOf(gfRate);
    if (!std::isfinite(model.baseLambda) || model.baseLambda <= 0.0) {
        return SimResult<GoalModel>::err(SimError(
            ErrorCode::DegenerateLeague, "league scoring rate must be positive"));
    }

    for (const auto& [team, rate] : gfRate) {
        model.attack[team] = rate / model.baseLambda;
    }
    for (const auto& [team, rate] : gaRate) {
        model.defense[team] = rate / model.baseLambda;
    }

    if (options.normalize) {
        double attackMean = meanOf(model.attack);
        double defenseMean = meanOf(model.defense);
        if (defenseMean <= 0.0) {
            return SimResult<GoalModel>::err(SimError(
                ErrorCode::DegenerateLeague, "no goals conceded; defense multipliers undefined"));
        }
        for (auto& [team, value] : model.attack) {
            value /= attackMean;
        }
        for (auto& [team, value] : model.defense) {
            value /= defenseMean;
        }
    }

    LSIM_LOG_DEBUG(LogCategory::GoalModel,
                   "goal model for " + std::to_string(model.attack.size()) +
                       " teams, base lambda " + std::to_string(model.baseLambda));
    return SimResult<GoalModel>::ok(std::move(model));
}

} // namespace

std::string_view zeroGamesPolicyName(ZeroGamesPolicy policy) {
    switch (policy) {
        case ZeroGamesPolicy::ZeroRate:         return "zero_rate";
        case ZeroGamesPolicy::ImputeLeagueMean: return "impute_mean";
    }
    return "unknown";
}

SimResult<ZeroGamesPolicy> parseZeroGamesPolicy(std::string_view name) {
    if (name == "zero_rate") {
        return SimResult<ZeroGamesPolicy>::ok(ZeroGamesPolicy::ZeroRate);
    }
    if (name == "impute_mean") {
        return SimResult<ZeroGamesPolicy>::ok(ZeroGamesPolicy::ImputeLeagueMean);
    }
    return SimResult<ZeroGamesPolicy>::err(SimError(
        ErrorCode::InvalidArgument, "unknown zero-games policy: " + std::string(name)));
}

RunningCounters LeagueGoalModel::countersFromStandings(const Standings& standings) {
    RunningCounters counters;
    for (const auto& [team, standing] : standings) {
        counters.goalsFor[team] = standing.goalsFor;
        counters.goalsAgainst[team] = standing.goalsAgainst;
        counters.gamesPlayed[team] = standing.matches;
        counters.draws[team] = standing.draws;
    }
    return counters;
}

SimResult<GoalModel> LeagueGoalModel::fromStandings(const Standings& standings,
                                                    const GoalModelOptions& options) {
    auto valid = validateStandings(standings);
    if (!valid) {
        return SimResult<GoalModel>::err(valid.error());
    }
    return buildModel(countersFromStandings(standings), options);
}

SimResult<GoalModel> LeagueGoalModel::fromCounters(const RunningCounters& counters,
                                                   const GoalModelOptions& options) {
    if (counters.gamesPlayed.empty()) {
        return SimResult<GoalModel>::err(
            SimError(ErrorCode::EmptyStandings, "running counters are empty"));
    }
    if (counters.goalsFor.size() != counters.gamesPlayed.size() ||
        counters.goalsAgainst.size() != counters.gamesPlayed.size()) {
        return SimResult<GoalModel>::err(SimError(
            ErrorCode::TeamNotFound, "goals-for, goals-against and games counters cover different teams"));
    }

    for (const auto& [team, games] : counters.gamesPlayed) {
        auto gf = lookupTeam(counters.goalsFor, team, "goals-for counters");
        if (!gf) {
            return SimResult<GoalModel>::err(gf.error());
        }
        auto ga = lookupTeam(counters.goalsAgainst, team, "goals-against counters");
        if (!ga) {
            return SimResult<GoalModel>::err(ga.error());
        }
        for (auto check : {checkCounter(team, games, "games played"),
                           checkCounter(team, gf.value(), "goals for"),
                           checkCounter(team, ga.value(), "goals against")}) {
            if (!check) {
                return SimResult<GoalModel>::err(check.error());
            }
        }
    }
    return buildModel(counters, options);
}

} // namespace lsim::model
