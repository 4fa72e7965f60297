#pragma once

/// @file league_types.hpp
/// @brief Core value types for the league rating and goal model.
///
/// Defines team standings, rating tables, running counters, the
/// attack/defense goal model, match probabilities, scorelines and
/// outcome scores.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "lsim/foundation/sim_result.hpp"

namespace lsim::model {

/// Team names are the keys of every per-team mapping.
using TeamName = std::string;

/// Season-to-date record for one team, as printed in a league table.
struct TeamStanding {
    int32_t matches = 0;         ///< M: matches played.
    int32_t points = 0;          ///< Pts.
    int32_t goalDifference = 0;  ///< GD = GF - GA.
    int32_t goalsFor = 0;        ///< GF.
    int32_t goalsAgainst = 0;    ///< GA.
    int32_t draws = 0;           ///< D.
};

/// League table snapshot keyed by team name.
///
/// An ordered map so every cross-team aggregation iterates the same keys
/// in the same order.
using Standings = std::map<TeamName, TeamStanding>;

/// Team -> Elo rating. The shared mutable state of a simulated season.
using RatingTable = std::map<TeamName, double>;

/// Team -> per-team real value (multipliers, counters).
using TeamValues = std::map<TeamName, double>;

/// Accumulated per-team totals used for mid-season model rebuilds.
struct RunningCounters {
    TeamValues goalsFor;
    TeamValues goalsAgainst;
    TeamValues gamesPlayed;
    TeamValues draws;
};

/// League scoring baseline plus per-team attack/defense multipliers.
///
/// After normalization both multiplier maps have mean 1.0, so
/// baseLambda * attack[a] * defense[b] reads as expected goals of a
/// against b relative to the league average.
struct GoalModel {
    double baseLambda = 0.0;  ///< League mean goals per team per match.
    TeamValues attack;
    TeamValues defense;
};

/// Win/draw/loss probabilities for team A against team B. Sum to 1.
struct MatchProbabilities {
    double winA = 0.0;
    double draw = 0.0;
    double winB = 0.0;
};

/// Final score of a single match.
struct Scoreline {
    int32_t goalsA = 0;
    int32_t goalsB = 0;

    friend bool operator==(const Scoreline&, const Scoreline&) = default;
};

/// Elo outcome score pair: (1,0), (0.5,0.5) or (0,1).
struct OutcomeScore {
    double scoreA = 0.0;
    double scoreB = 0.0;

    friend bool operator==(const OutcomeScore&, const OutcomeScore&) = default;
};

/// Pair of ratings produced by an Elo update.
struct EloPair {
    double eloA = 0.0;
    double eloB = 0.0;
};

/// Look up a team in a per-team map.
///
/// @param what Name of the map for the error message ("rating", "attack").
/// @return The value or TeamNotFound.
[[nodiscard]] foundation::SimResult<double> lookupTeam(const TeamValues& values,
                                                       const TeamName& team,
                                                       std::string_view what);

} // namespace lsim::model
