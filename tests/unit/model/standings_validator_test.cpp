#include <gtest/gtest.h>

#include <string>

#include "lsim/model/standings_validator.hpp"

using namespace lsim::model;
using lsim::foundation::ErrorCode;

namespace {

void expectInvalid(const TeamStanding& standing, const std::string& team = "Leeds") {
    auto result = validateStanding(team, standing);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidStanding);
}

} // namespace

TEST(StandingsValidatorTest, ValidRow) {
    EXPECT_TRUE(validateStanding("Leeds", TeamStanding{10, 14, -2, 11, 13, 5}).hasValue());
    EXPECT_TRUE(validateStanding("Leeds", TeamStanding{}).hasValue());
}

TEST(StandingsValidatorTest, EmptyTeamName) {
    expectInvalid(TeamStanding{}, "");
}

TEST(StandingsValidatorTest, NegativeMatches) {
    expectInvalid(TeamStanding{-1, 0, 0, 0, 0, 0});
}

TEST(StandingsValidatorTest, NegativeGoals) {
    expectInvalid(TeamStanding{3, 3, 4, 3, -1, 0});
    expectInvalid(TeamStanding{3, 3, -4, -1, 3, 0});
}

TEST(StandingsValidatorTest, DrawsOutsideMatches) {
    expectInvalid(TeamStanding{3, 3, 0, 2, 2, 4});
    expectInvalid(TeamStanding{3, 3, 0, 2, 2, -1});
}

TEST(StandingsValidatorTest, InconsistentGoalDifference) {
    expectInvalid(TeamStanding{10, 14, 5, 11, 13, 5});
}

TEST(StandingsValidatorTest, ErrorCarriesTeamName) {
    auto result = validateStanding("Leeds", TeamStanding{10, 14, 5, 11, 13, 5});
    ASSERT_TRUE(result.hasError());
    auto* team = result.error().context<std::string>();
    ASSERT_NE(team, nullptr);
    EXPECT_EQ(*team, "Leeds");
}

TEST(StandingsValidatorTest, EmptyTable) {
    auto result = validateStandings(Standings{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::EmptyStandings);
}

TEST(StandingsValidatorTest, FirstBadRowReported) {
    Standings s;
    s["Arsenal"] = TeamStanding{2, 6, 3, 4, 1, 0};
    s["Burnley"] = TeamStanding{2, 0, 0, 1, 4, 0};

    auto result = validateStandings(s);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidStanding);
    EXPECT_NE(result.error().message().find("Burnley"), std::string::npos);
}
