/// @file season_simulator.cpp
/// @brief SeasonSimulator implementation.

#include "lsim/season/season_simulator.hpp"

#include <optional>
#include <string>
#include <utility>

#include "lsim/foundation/sim_logger.hpp"
#include "lsim/model/elo_updater.hpp"
#include "lsim/model/league_goal_model.hpp"
#include "lsim/model/league_statistics.hpp"
#include "lsim/model/outcome_probability.hpp"
#include "lsim/model/rating_initializer.hpp"
#include "lsim/model/result_classifier.hpp"
#include "lsim/model/standings_validator.hpp"

namespace lsim::season {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SimError;
using foundation::SimLogger;
using foundation::SimResult;
using model::EloUpdater;
using model::LeagueGoalModel;
using model::LeagueStatistics;

SeasonSimulator::SeasonSimulator(SimulatorConfig config,
                                 model::RatingTable ratings,
                                 model::GoalModel goalModel,
                                 model::RunningCounters counters,
                                 std::unique_ptr<simulation::IGoalSimulator> simulator)
    : config_(std::move(config)),
      ratings_(std::move(ratings)),
      goalModel_(std::move(goalModel)),
      counters_(std::move(counters)),
      drawProb_(LeagueStatistics::estimateDrawProb(counters_)),
      simulator_(std::move(simulator)) {}

SimResult<SeasonSimulator> SeasonSimulator::create(const model::Standings& standings,
                                                   const SimulatorConfig& config) {
    auto validConfig = validateSimulatorConfig(config);
    if (!validConfig) {
        return SimResult<SeasonSimulator>::err(validConfig.error());
    }
    auto validStandings = model::validateStandings(standings);
    if (!validStandings) {
        return SimResult<SeasonSimulator>::err(validStandings.error());
    }

    auto ratings = model::RatingInitializer::computeAutoElo(standings, config.ratingWeights);
    if (!ratings) {
        return SimResult<SeasonSimulator>::err(ratings.error());
    }
    // The Elo strategy never reads the goal model, so a preseason snapshot
    // with no goals yet is still playable.
    model::GoalModel initialModel;
    auto goalModel = LeagueGoalModel::fromStandings(standings, config.goalModel);
    if (goalModel) {
        initialModel = std::move(goalModel).value();
    } else if (config.goals.strategy == simulation::GoalStrategy::EloPoisson &&
               goalModel.error().code() == ErrorCode::DegenerateLeague) {
        LSIM_LOG_WARN(LogCategory::Season,
                      "goal model unavailable (" + std::string(goalModel.error().message()) +
                          "); Elo strategy continues without it");
    } else {
        return SimResult<SeasonSimulator>::err(goalModel.error());
    }

    SimulatorConfig effective = config;
    auto baseGoals = LeagueStatistics::calculateBaseGoals(standings);
    if (baseGoals) {
        effective.goals.elo.baseLambda = baseGoals.value();
    } else {
        LSIM_LOG_WARN(LogCategory::Season,
                      "no matches in standings; Elo strategy keeps configured base lambda " +
                          std::to_string(config.goals.elo.baseLambda));
    }

    auto simulator = simulation::createGoalSimulator(effective.goals);
    if (!simulator) {
        return SimResult<SeasonSimulator>::err(simulator.error());
    }

    LSIM_LOG_INFO(LogCategory::Season,
                  "season simulator ready: " + std::to_string(standings.size()) +
                      " teams, strategy " + std::string(simulator.value()->name()));

    return SimResult<SeasonSimulator>::ok(SeasonSimulator(
        std::move(effective),
        std::move(ratings).value(),
        std::move(initialModel),
        LeagueGoalModel::countersFromStandings(standings),
        std::move(simulator).value()));
}

void SeasonSimulator::accumulate(model::RunningCounters& counters,
                                 const Fixture& fixture,
                                 const model::Scoreline& score) {
    counters.goalsFor[fixture.teamA] += score.goalsA;
    counters.goalsAgainst[fixture.teamA] += score.goalsB;
    counters.gamesPlayed[fixture.teamA] += 1.0;
    counters.goalsFor[fixture.teamB] += score.goalsB;
    counters.goalsAgainst[fixture.teamB] += score.goalsA;
    counters.gamesPlayed[fixture.teamB] += 1.0;
    if (score.goalsA == score.goalsB) {
        counters.draws[fixture.teamA] += 1.0;
        counters.draws[fixture.teamB] += 1.0;
    }
}

SimResult<MatchRecord> SeasonSimulator::playFixture(const Fixture& fixture,
                                                    simulation::RandomSource& random) {
    if (fixture.teamA == fixture.teamB) {
        return SimResult<MatchRecord>::err(SimError(
            ErrorCode::InvalidArgument, "team '" + fixture.teamA + "' cannot play itself"));
    }
    auto eloA = model::lookupTeam(ratings_, fixture.teamA, "rating table");
    if (!eloA) {
        return SimResult<MatchRecord>::err(eloA.error());
    }
    auto eloB = model::lookupTeam(ratings_, fixture.teamB, "rating table");
    if (!eloB) {
        return SimResult<MatchRecord>::err(eloB.error());
    }

    MatchRecord record;
    record.fixture = fixture;
    record.index = fixturesPlayed_;
    record.ratingsBefore = model::EloPair{eloA.value(), eloB.value()};

    auto probs = model::OutcomeProbability::matchProbs(eloA.value(), eloB.value(), drawProb_);
    if (!probs) {
        return SimResult<MatchRecord>::err(probs.error());
    }
    record.probabilities = probs.value();

    simulation::MatchContext ctx{fixture.teamA, fixture.teamB, &ratings_, &goalModel_};
    auto score = simulator_->simulate(ctx, random);
    if (!score) {
        LSIM_LOG_ERROR(LogCategory::Season,
                       "fixture " + std::to_string(record.index) + " failed: " +
                           std::string(score.error().message()));
        return SimResult<MatchRecord>::err(score.error());
    }
    record.score = score.value();
    record.outcome = model::ResultClassifier::getMatchResult(record.score);

    // Prepare the rebuilt model before touching any season state.
    bool rebuildDue = config_.rebuildInterval > 0 &&
                      (fixturesPlayed_ + 1) % config_.rebuildInterval == 0;
    std::optional<model::GoalModel> rebuilt;
    if (rebuildDue) {
        auto next = counters_;
        accumulate(next, fixture, record.score);
        auto fresh = LeagueGoalModel::fromCounters(next, config_.goalModel);
        if (fresh) {
            rebuilt = std::move(fresh).value();
        } else if (fresh.error().code() == ErrorCode::DegenerateLeague) {
            LSIM_LOG_WARN(LogCategory::Season,
                          "goal model rebuild skipped: " + std::string(fresh.error().message()));
        } else {
            return SimResult<MatchRecord>::err(fresh.error());
        }
    }

    auto updated = EloUpdater::applyResult(ratings_, fixture.teamA, fixture.teamB,
                                           record.outcome, config_.kFactor);
    if (!updated) {
        return SimResult<MatchRecord>::err(updated.error());
    }
    record.ratingsAfter = updated.value();

    accumulate(counters_, fixture, record.score);
    drawProb_ = LeagueStatistics::estimateDrawProb(counters_);
    ++fixturesPlayed_;
    if (rebuilt) {
        goalModel_ = std::move(*rebuilt);
        LSIM_LOG_DEBUG(LogCategory::Season,
                       "goal model rebuilt after " + std::to_string(fixturesPlayed_) + " fixtures");
    }

    if (SimLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Season)) {
        LogContext logCtx;
        logCtx.team = fixture.teamA;
        logCtx.opponent = fixture.teamB;
        logCtx.fixtureIndex = record.index;
        logCtx.extra["score"] = std::to_string(record.score.goalsA) + "-" +
                                std::to_string(record.score.goalsB);
        logCtx.extra["elo_after"] = std::to_string(record.ratingsAfter.eloA) + "/" +
                                    std::to_string(record.ratingsAfter.eloB);
        SimLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Season,
                                             "fixture resolved", logCtx);
    }

    return SimResult<MatchRecord>::ok(std::move(record));
}

SimResult<std::vector<MatchRecord>> SeasonSimulator::playFixtures(
    const std::vector<Fixture>& fixtures, simulation::RandomSource& random) {
    std::vector<MatchRecord> records;
    records.reserve(fixtures.size());
    for (const auto& fixture : fixtures) {
        auto record = playFixture(fixture, random);
        if (!record) {
            LSIM_LOG_ERROR(LogCategory::Season,
                           "fixture list stopped after " + std::to_string(records.size()) +
                               " of " + std::to_string(fixtures.size()) + " applied: " +
                               std::string(record.error().message()));
            return SimResult<std::vector<MatchRecord>>::err(record.error());
        }
        records.push_back(std::move(record).value());
    }
    return SimResult<std::vector<MatchRecord>>::ok(std::move(records));
}

SimResult<void> SeasonSimulator::rebuildGoalModel() {
    auto fresh = LeagueGoalModel::fromCounters(counters_, config_.goalModel);
    if (!fresh) {
        return SimResult<void>::err(fresh.error());
    }
    goalModel_ = std::move(fresh).value();
    return SimResult<void>::ok();
}

} // namespace lsim::season
