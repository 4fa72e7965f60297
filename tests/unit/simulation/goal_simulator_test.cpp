#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "lsim/simulation/goal_simulator.hpp"

using namespace lsim::simulation;
using lsim::foundation::ErrorCode;
using lsim::model::GoalModel;
using lsim::model::RatingTable;
using lsim::model::Scoreline;

// ---------------------------------------------------------------------------
// Fixture: two-team league with a goal model and ratings
// ---------------------------------------------------------------------------

class GoalSimulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ratings_ = {{"Arsenal", 1600.0}, {"Chelsea", 1400.0}};

        model_.baseLambda = 1.4;
        model_.attack = {{"Arsenal", 1.3}, {"Chelsea", 0.7}};
        model_.defense = {{"Arsenal", 0.8}, {"Chelsea", 1.2}};
    }

    MatchContext context(const char* a = "Arsenal", const char* b = "Chelsea") const {
        MatchContext ctx;
        ctx.teamA = a;
        ctx.teamB = b;
        ctx.ratings = &ratings_;
        ctx.goalModel = &model_;
        return ctx;
    }

    RatingTable ratings_;
    GoalModel model_;
};

// ---------------------------------------------------------------------------
// Expected goals formulas
// ---------------------------------------------------------------------------

TEST(ExpectedGoalsTest, EloFormula) {
    auto goals = expectedGoalsElo(1600.0, 1400.0, 1.5, 800.0);
    EXPECT_NEAR(goals.goalsA, 1.5 * std::pow(10.0, 0.25), 1e-12);
    EXPECT_NEAR(goals.goalsB, 1.5 * std::pow(10.0, -0.25), 1e-12);
}

TEST(ExpectedGoalsTest, EloFormulaEqualRatings) {
    auto goals = expectedGoalsElo(1500.0, 1500.0, 1.3);
    EXPECT_DOUBLE_EQ(goals.goalsA, 1.3);
    EXPECT_DOUBLE_EQ(goals.goalsB, 1.3);
}

TEST(ExpectedGoalsTest, HybridFormula) {
    auto goals = expectedGoalsHybrid(1.4, 1.3, 0.8, 0.7, 1.2);
    EXPECT_NEAR(goals.goalsA, 1.4 * 1.3 * 1.2, 1e-12);
    EXPECT_NEAR(goals.goalsB, 1.4 * 0.7 * 0.8, 1e-12);
}

TEST(ExpectedGoalsTest, EloCorrection) {
    auto corrected = applyEloCorrection(ExpectedGoals{2.0, 1.0}, 1900.0, 1100.0, 800.0);
    EXPECT_NEAR(corrected.goalsA, 20.0, 1e-9);
    EXPECT_NEAR(corrected.goalsB, 0.1, 1e-12);
}

// ---------------------------------------------------------------------------
// Strategy names and factory
// ---------------------------------------------------------------------------

TEST(GoalStrategyTest, NamesRoundTrip) {
    for (auto strategy : {GoalStrategy::EloPoisson, GoalStrategy::Hybrid}) {
        auto parsed = parseGoalStrategy(goalStrategyName(strategy));
        ASSERT_TRUE(parsed.hasValue());
        EXPECT_EQ(parsed.value(), strategy);
    }
    EXPECT_TRUE(parseGoalStrategy("dixon-coles").hasError());
}

TEST(GoalStrategyTest, FactoryBuildsConfiguredStrategy) {
    GoalSimulatorConfig config;
    auto hybrid = createGoalSimulator(config);
    ASSERT_TRUE(hybrid.hasValue());
    EXPECT_EQ(hybrid.value()->name(), "hybrid");

    config.strategy = GoalStrategy::EloPoisson;
    auto elo = createGoalSimulator(config);
    ASSERT_TRUE(elo.hasValue());
    EXPECT_EQ(elo.value()->name(), "elo");
}

TEST(GoalStrategyTest, FactoryRejectsBadParameters) {
    GoalSimulatorConfig config;
    config.hybrid.drawBias = 1.2;
    EXPECT_EQ(createGoalSimulator(config).error().code(), ErrorCode::InvalidArgument);

    config = GoalSimulatorConfig{};
    config.hybrid.eloFactor = 0.0;
    EXPECT_EQ(createGoalSimulator(config).error().code(), ErrorCode::InvalidArgument);

    config = GoalSimulatorConfig{};
    config.strategy = GoalStrategy::EloPoisson;
    config.elo.baseLambda = -1.0;
    EXPECT_EQ(createGoalSimulator(config).error().code(), ErrorCode::InvalidArgument);

    config.elo.baseLambda = 1.5;
    config.elo.eloScale = std::numeric_limits<double>::infinity();
    EXPECT_EQ(createGoalSimulator(config).error().code(), ErrorCode::InvalidArgument);
}

TEST(GoalStrategyTest, FactoryRejectsNegativeScales) {
    // A negative divisor would hand the weaker side the larger expectation.
    GoalSimulatorConfig config;
    config.hybrid.eloFactor = -800.0;
    EXPECT_EQ(createGoalSimulator(config).error().code(), ErrorCode::InvalidArgument);

    config = GoalSimulatorConfig{};
    config.strategy = GoalStrategy::EloPoisson;
    config.elo.eloScale = -800.0;
    EXPECT_EQ(createGoalSimulator(config).error().code(), ErrorCode::InvalidArgument);
}

// ---------------------------------------------------------------------------
// EloPoissonSimulator
// ---------------------------------------------------------------------------

TEST_F(GoalSimulatorTest, EloSamplesRawPoissonPair) {
    EloPoissonSimulator sim;
    RandomSource random(11);
    RandomSource replay(11);
    auto expected = expectedGoalsElo(1600.0, 1400.0, 1.5, 800.0);

    for (int i = 0; i < 200; ++i) {
        auto score = sim.simulate(context(), random);
        ASSERT_TRUE(score.hasValue());
        int32_t a = replay.samplePoisson(expected.goalsA);
        int32_t b = replay.samplePoisson(expected.goalsB);
        EXPECT_EQ(score.value(), (Scoreline{a, b}));
    }
}

TEST_F(GoalSimulatorTest, EloRequiresRatings) {
    EloPoissonSimulator sim;
    RandomSource random(1);
    auto ctx = context();
    ctx.ratings = nullptr;

    auto score = sim.simulate(ctx, random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::MissingInput);
}

TEST_F(GoalSimulatorTest, EloUnknownTeam) {
    EloPoissonSimulator sim;
    RandomSource random(1);

    auto score = sim.simulate(context("Arsenal", "Leeds"), random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::TeamNotFound);
}

TEST_F(GoalSimulatorTest, EloNonFiniteRatingFailsFast) {
    EloPoissonSimulator sim;
    RandomSource random(1);
    ratings_["Chelsea"] = std::numeric_limits<double>::quiet_NaN();

    auto score = sim.simulate(context(), random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::InvalidExpectedGoals);
}

// ---------------------------------------------------------------------------
// HybridPoissonSimulator
// ---------------------------------------------------------------------------

TEST_F(GoalSimulatorTest, HybridGoalsAreNonNegative) {
    HybridPoissonSimulator sim;
    RandomSource random(3);
    for (int i = 0; i < 1000; ++i) {
        auto score = sim.simulate(context(), random);
        ASSERT_TRUE(score.hasValue());
        EXPECT_GE(score.value().goalsA, 0);
        EXPECT_GE(score.value().goalsB, 0);
    }
}

TEST_F(GoalSimulatorTest, HybridSameSeedSameScores) {
    HybridPoissonSimulator sim;
    RandomSource a(77);
    RandomSource b(77);
    for (int i = 0; i < 100; ++i) {
        auto first = sim.simulate(context(), a);
        auto second = sim.simulate(context(), b);
        ASSERT_TRUE(first.hasValue());
        ASSERT_TRUE(second.hasValue());
        EXPECT_EQ(first.value(), second.value());
    }
}

TEST_F(GoalSimulatorTest, HybridFullDrawBiasAlwaysDraws) {
    HybridPoissonParams params;
    params.drawBias = 1.0;
    HybridPoissonSimulator sim(params);
    RandomSource random(5);

    for (int i = 0; i < 500; ++i) {
        auto score = sim.simulate(context(), random);
        ASSERT_TRUE(score.hasValue());
        EXPECT_EQ(score.value().goalsA, score.value().goalsB);
    }
}

TEST_F(GoalSimulatorTest, HybridForcedDrawLevelsAtRoundedMean) {
    HybridPoissonParams params;
    params.drawBias = 1.0;
    HybridPoissonSimulator sim(params);
    RandomSource random(13);
    RandomSource replay(13);

    auto expected = applyEloCorrection(expectedGoalsHybrid(1.4, 1.3, 0.8, 0.7, 1.2),
                                       1600.0, 1400.0, params.eloFactor);
    int forced = 0;
    for (int i = 0; i < 500; ++i) {
        auto score = sim.simulate(context(), random);
        ASSERT_TRUE(score.hasValue());

        int32_t a = replay.samplePoisson(expected.goalsA);
        int32_t b = replay.samplePoisson(expected.goalsB);
        if (a != b) {
            EXPECT_TRUE(replay.bernoulli(params.drawBias));
            auto level = static_cast<int32_t>(std::nearbyint((a + b) / 2.0));
            EXPECT_EQ(score.value(), (Scoreline{level, level})) << "raw " << a << "-" << b;
            ++forced;
        } else {
            EXPECT_EQ(score.value(), (Scoreline{a, b}));
        }
    }
    EXPECT_GT(forced, 0);
}

TEST_F(GoalSimulatorTest, HybridZeroDrawBiasIsRawPoisson) {
    HybridPoissonParams params;
    params.drawBias = 0.0;
    HybridPoissonSimulator sim(params);
    RandomSource random(8);
    RandomSource replay(8);

    auto expected = applyEloCorrection(expectedGoalsHybrid(1.4, 1.3, 0.8, 0.7, 1.2),
                                       1600.0, 1400.0, params.eloFactor);
    for (int i = 0; i < 500; ++i) {
        auto score = sim.simulate(context(), random);
        ASSERT_TRUE(score.hasValue());
        int32_t a = replay.samplePoisson(expected.goalsA);
        int32_t b = replay.samplePoisson(expected.goalsB);
        EXPECT_EQ(score.value(), (Scoreline{a, b}));
    }
}

TEST_F(GoalSimulatorTest, HybridWithoutEloIgnoresRatings) {
    HybridPoissonParams params;
    params.useElo = false;
    params.drawBias = 0.0;
    HybridPoissonSimulator sim(params);
    RandomSource random(21);
    RandomSource replay(21);

    auto ctx = context();
    ctx.ratings = nullptr;
    auto expected = expectedGoalsHybrid(1.4, 1.3, 0.8, 0.7, 1.2);
    for (int i = 0; i < 100; ++i) {
        auto score = sim.simulate(ctx, random);
        ASSERT_TRUE(score.hasValue());
        int32_t a = replay.samplePoisson(expected.goalsA);
        int32_t b = replay.samplePoisson(expected.goalsB);
        EXPECT_EQ(score.value(), (Scoreline{a, b}));
    }
}

TEST_F(GoalSimulatorTest, HybridRequiresGoalModel) {
    HybridPoissonSimulator sim;
    RandomSource random(1);
    auto ctx = context();
    ctx.goalModel = nullptr;

    auto score = sim.simulate(ctx, random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::MissingInput);
}

TEST_F(GoalSimulatorTest, HybridNegativeMultiplierFailsFast) {
    HybridPoissonSimulator sim;
    RandomSource random(1);
    model_.attack["Chelsea"] = -0.4;

    auto score = sim.simulate(context(), random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::InvalidExpectedGoals);
}

TEST_F(GoalSimulatorTest, HybridSteepEloCorrectionFailsFast) {
    HybridPoissonParams params;
    params.eloFactor = 1.0;
    HybridPoissonSimulator sim(params);
    RandomSource random(1);

    auto score = sim.simulate(context(), random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::InvalidExpectedGoals);
}

TEST_F(GoalSimulatorTest, EloSteepScaleFailsFast) {
    EloPoissonParams params;
    params.eloScale = 10.0;
    EloPoissonSimulator sim(params);
    RandomSource random(1);

    // 200 point gap over a scale of 10 gives 1.5e20 expected goals.
    auto score = sim.simulate(context(), random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::InvalidExpectedGoals);
}

TEST_F(GoalSimulatorTest, ExpectedGoalsAtCapStillSample) {
    EloPoissonParams params;
    params.baseLambda = kMaxExpectedGoals;
    EloPoissonSimulator sim(params);
    RandomSource random(1);
    ratings_["Chelsea"] = 1600.0;

    auto score = sim.simulate(context(), random);
    ASSERT_TRUE(score.hasValue());
    EXPECT_GT(score.value().goalsA, 0);
}

TEST_F(GoalSimulatorTest, HybridMissingMultiplier) {
    HybridPoissonSimulator sim;
    RandomSource random(1);
    model_.defense.erase("Arsenal");

    auto score = sim.simulate(context(), random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::TeamNotFound);
}

TEST_F(GoalSimulatorTest, HybridSelfMatchRejected) {
    HybridPoissonSimulator sim;
    RandomSource random(1);

    auto score = sim.simulate(context("Arsenal", "Arsenal"), random);
    ASSERT_TRUE(score.hasError());
    EXPECT_EQ(score.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(GoalSimulatorTest, StrategiesShareInterface) {
    GoalSimulatorConfig config;
    config.hybrid.drawBias = 1.0;
    auto sim = createGoalSimulator(config);
    ASSERT_TRUE(sim.hasValue());

    const IGoalSimulator& simulator = *sim.value();
    RandomSource random(9);
    auto score = simulator.simulate(context(), random);
    ASSERT_TRUE(score.hasValue());
    EXPECT_EQ(score.value().goalsA, score.value().goalsB);
}
