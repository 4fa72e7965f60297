/// @file random_source.cpp
/// @brief RandomSource sampling on std::mt19937_64.

#include "lsim/simulation/random_source.hpp"

#include <algorithm>

namespace lsim::simulation {

int32_t RandomSource::samplePoisson(double mean) {
    if (mean <= 0.0) {
        return 0;
    }
    // poisson_distribution<int32_t> does not terminate for means near INT32_MAX.
    std::poisson_distribution<int32_t> dist(std::min(mean, kMaxPoissonMean));
    return dist(engine_);
}

bool RandomSource::bernoulli(double p) {
    std::bernoulli_distribution dist(std::clamp(p, 0.0, 1.0));
    return dist(engine_);
}

void RandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
}

} // namespace lsim::simulation
