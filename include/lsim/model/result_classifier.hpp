#pragma once

/// @file result_classifier.hpp
/// @brief Scoreline to Elo outcome score.

#include <cstdint>

#include "lsim/model/league_types.hpp"

namespace lsim::model {

class ResultClassifier {
public:
    ResultClassifier() = delete;

    /// (1, 0) if A scored more, (0.5, 0.5) on equal goals, (0, 1) otherwise.
    [[nodiscard]] static OutcomeScore getMatchResult(int32_t goalsA, int32_t goalsB) noexcept;

    [[nodiscard]] static OutcomeScore getMatchResult(const Scoreline& score) noexcept {
        return getMatchResult(score.goalsA, score.goalsB);
    }
};

} // namespace lsim::model
