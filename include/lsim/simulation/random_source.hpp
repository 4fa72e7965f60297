#pragma once

/// @file random_source.hpp
/// @brief Seedable random source injected into every sampling call.

#include <cstdint>
#include <random>

namespace lsim::simulation {

/// Explicit pseudo-random source.
///
/// Owned by the caller and passed by reference, so a given seed replays the
/// same season and independent simulations never share generator state.
/// Not thread-safe; use one instance per thread.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

    RandomSource(const RandomSource&) = delete;
    RandomSource& operator=(const RandomSource&) = delete;
    RandomSource(RandomSource&&) noexcept = default;
    RandomSource& operator=(RandomSource&&) noexcept = default;

    /// Largest Poisson mean sampled; larger means are capped to it.
    static constexpr double kMaxPoissonMean = 1.0e6;

    /// Poisson draw. A mean of 0 yields 0.
    /// The caller guarantees mean is finite and non-negative.
    [[nodiscard]] int32_t samplePoisson(double mean);

    /// True with probability p, clamped to [0, 1].
    [[nodiscard]] bool bernoulli(double p);

    /// Restart the sequence from a new seed.
    void reseed(uint64_t seed);

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace lsim::simulation
