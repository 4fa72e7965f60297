/// @file league_statistics.cpp
/// @brief LeagueStatistics implementation.

#include "lsim/model/league_statistics.hpp"

namespace lsim::model {

using foundation::ErrorCode;
using foundation::SimError;
using foundation::SimResult;

namespace {

double drawRate(double totalDraws, double totalMatches) {
    if (totalMatches <= 0.0) {
        return LeagueStatistics::kDefaultDrawProb;
    }
    return (totalDraws / 2.0) / (totalMatches / 2.0);
}

} // namespace

SimResult<double> LeagueStatistics::calculateBaseGoals(const Standings& standings) {
    if (standings.empty()) {
        return SimResult<double>::err(SimError(ErrorCode::EmptyStandings, "standings table is empty"));
    }

    double totalGoals = 0.0;
    double totalAppearances = 0.0;
    for (const auto& [team, standing] : standings) {
        totalGoals += standing.goalsFor;
        totalAppearances += standing.matches;
    }
    if (totalAppearances <= 0.0) {
        return SimResult<double>::err(
            SimError(ErrorCode::DegenerateLeague, "no matches played; base goals undefined"));
    }

    double totalMatches = totalAppearances / 2.0;
    return SimResult<double>::ok(totalGoals / totalMatches / 2.0);
}

double LeagueStatistics::estimateDrawProb(const Standings& standings) {
    double draws = 0.0;
    double matches = 0.0;
    for (const auto& [team, standing] : standings) {
        draws += standing.draws;
        matches += standing.matches;
    }
    return drawRate(draws, matches);
}

double LeagueStatistics::estimateDrawProb(const RunningCounters& counters) {
    double draws = 0.0;
    double matches = 0.0;
    for (const auto& [team, d] : counters.draws) {
        draws += d;
    }
    for (const auto& [team, games] : counters.gamesPlayed) {
        matches += games;
    }
    return drawRate(draws, matches);
}

} // namespace lsim::model
