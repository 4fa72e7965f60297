/// @file season_integration_test.cpp
/// @brief Integration tests for a full simulated season: YAML config,
///        rating initialization, goal sampling and Elo feedback together.

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "lsim/lsim.hpp"

using namespace lsim::season;
using lsim::foundation::ConfigManager;
using lsim::model::Standings;
using lsim::model::TeamStanding;
using lsim::simulation::GoalStrategy;
using lsim::simulation::RandomSource;

// ============================================================================
// Integration Tests
// ============================================================================

class SeasonIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        standings_["Liverpool"] = TeamStanding{19, 45, 30, 42, 12, 3};
        standings_["Arsenal"] = TeamStanding{19, 40, 22, 38, 16, 4};
        standings_["Villa"] = TeamStanding{19, 33, 8, 36, 28, 6};
        standings_["Brighton"] = TeamStanding{19, 26, 0, 30, 30, 5};
        standings_["Forest"] = TeamStanding{19, 20, -12, 24, 36, 5};
        standings_["Luton"] = TeamStanding{19, 13, -20, 20, 40, 4};

        ConfigManager manager;
        ASSERT_TRUE(manager.load(LSIM_SAMPLE_CONFIG).hasValue());
        auto loaded = loadSimulatorConfig(manager);
        ASSERT_TRUE(loaded.hasValue());
        config_ = loaded.value();
    }

    std::vector<Fixture> doubleRoundRobin() const {
        std::vector<Fixture> fixtures;
        for (const auto& [home, a] : standings_) {
            for (const auto& [away, b] : standings_) {
                if (home != away) {
                    fixtures.push_back(Fixture{home, away});
                }
            }
        }
        return fixtures;
    }

    static double ratingTotal(const lsim::model::RatingTable& ratings) {
        double total = 0.0;
        for (const auto& [team, elo] : ratings) {
            total += elo;
        }
        return total;
    }

    Standings standings_;
    SimulatorConfig config_;
};

TEST_F(SeasonIntegrationTest, SampleConfigLoads) {
    EXPECT_EQ(config_.goals.strategy, GoalStrategy::Hybrid);
    EXPECT_EQ(config_.rebuildInterval, 10u);
    EXPECT_EQ(config_.seed, 42u);
    EXPECT_DOUBLE_EQ(config_.kFactor, 20.0);
}

TEST_F(SeasonIntegrationTest, FullSeasonConservesRatingTotal) {
    auto created = SeasonSimulator::create(standings_, config_);
    ASSERT_TRUE(created.hasValue());
    auto sim = std::move(created).value();
    double before = ratingTotal(sim.ratings());

    RandomSource random(config_.seed);
    auto records = sim.playFixtures(doubleRoundRobin(), random);
    ASSERT_TRUE(records.hasValue());

    EXPECT_EQ(records.value().size(), 30u);
    EXPECT_EQ(sim.fixturesPlayed(), 30u);
    EXPECT_NEAR(ratingTotal(sim.ratings()), before, 1e-6);
    for (const auto& [team, games] : sim.counters().gamesPlayed) {
        EXPECT_DOUBLE_EQ(games, 29.0) << team;
    }
}

TEST_F(SeasonIntegrationTest, SeededSeasonReplays) {
    auto first = SeasonSimulator::create(standings_, config_);
    auto second = SeasonSimulator::create(standings_, config_);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());

    RandomSource ra(config_.seed);
    RandomSource rb(config_.seed);
    ASSERT_TRUE(first.value().playFixtures(doubleRoundRobin(), ra).hasValue());
    ASSERT_TRUE(second.value().playFixtures(doubleRoundRobin(), rb).hasValue());

    EXPECT_EQ(first.value().ratings(), second.value().ratings());
    EXPECT_EQ(first.value().goalModel().attack, second.value().goalModel().attack);
}

TEST_F(SeasonIntegrationTest, StrongerTeamsEarnMorePoints) {
    constexpr int kSeasons = 200;
    std::map<std::string, double> points;
    RandomSource random(config_.seed);

    for (int season = 0; season < kSeasons; ++season) {
        auto created = SeasonSimulator::create(standings_, config_);
        ASSERT_TRUE(created.hasValue());
        auto sim = std::move(created).value();

        auto records = sim.playFixtures(doubleRoundRobin(), random);
        ASSERT_TRUE(records.hasValue());
        for (const auto& r : records.value()) {
            points[r.fixture.teamA] += r.outcome.scoreA == 1.0 ? 3.0 : (r.outcome.scoreA == 0.5 ? 1.0 : 0.0);
            points[r.fixture.teamB] += r.outcome.scoreB == 1.0 ? 3.0 : (r.outcome.scoreB == 0.5 ? 1.0 : 0.0);
        }
    }

    EXPECT_GT(points["Liverpool"], points["Brighton"]);
    EXPECT_GT(points["Brighton"], points["Luton"]);
}

TEST_F(SeasonIntegrationTest, EloStrategyFromYaml) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromString("goals:\n  strategy: elo\nelo:\n  k_factor: 30\n").hasValue());
    auto loaded = loadSimulatorConfig(manager);
    ASSERT_TRUE(loaded.hasValue());

    auto created = SeasonSimulator::create(standings_, loaded.value());
    ASSERT_TRUE(created.hasValue());
    auto sim = std::move(created).value();
    EXPECT_EQ(sim.strategyName(), "elo");

    RandomSource random(loaded.value().seed);
    auto records = sim.playFixtures(doubleRoundRobin(), random);
    ASSERT_TRUE(records.hasValue());
    for (const auto& r : records.value()) {
        EXPECT_GE(r.score.goalsA, 0);
        EXPECT_GE(r.score.goalsB, 0);
    }
}
