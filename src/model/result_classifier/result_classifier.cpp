/// @file result_classifier.cpp
/// @brief ResultClassifier implementation.

#include "lsim/model/result_classifier.hpp"

namespace lsim::model {

OutcomeScore ResultClassifier::getMatchResult(int32_t goalsA, int32_t goalsB) noexcept {
    if (goalsA > goalsB) {
        return OutcomeScore{1.0, 0.0};
    }
    if (goalsA == goalsB) {
        return OutcomeScore{0.5, 0.5};
    }
    return OutcomeScore{0.0, 1.0};
}

} // namespace lsim::model
