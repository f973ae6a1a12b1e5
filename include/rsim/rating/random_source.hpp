#pragma once

/// @file random_source.hpp
/// @brief Explicit, seedable random stream threaded through a simulation.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace rsim::rating {

/// Source of the random draws consumed by one simulation run.
///
/// A run consumes, per round and in this order: one subject draw
/// (uniformIndex), one opponent draw (uniformIndex) and one outcome
/// draw (uniform01).
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform value in [0, 1).
    virtual double uniform01() = 0;

    /// Uniform index in [0, count). @p count must be positive.
    virtual std::size_t uniformIndex(std::size_t count) = 0;
};

/// Mersenne Twister backed RandomSource.
///
/// Two instances created with the same seed produce identical streams.
class Mt19937RandomSource final : public RandomSource {
public:
    /// Deterministic stream.
    explicit Mt19937RandomSource(uint64_t seed);

    /// Seed from @p seed when present, otherwise from std::random_device.
    explicit Mt19937RandomSource(std::optional<uint64_t> seed);

    double uniform01() override;
    std::size_t uniformIndex(std::size_t count) override;

    /// Seed actually used to initialise the engine.
    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace rsim::rating
