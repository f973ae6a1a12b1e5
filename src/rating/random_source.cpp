/// @file random_source.cpp
/// @brief Mt19937RandomSource implementation.

#include "rsim/rating/random_source.hpp"

#include <cmath>

namespace rsim::rating {

namespace {

uint64_t nondeterministicSeed() {
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) ^ static_cast<uint64_t>(device());
}

} // namespace

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed)
    : seed_(seed), engine_(seed) {}

Mt19937RandomSource::Mt19937RandomSource(std::optional<uint64_t> seed)
    : Mt19937RandomSource(seed ? *seed : nondeterministicSeed()) {}

double Mt19937RandomSource::uniform01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    double value = dist(engine_);
    // generate_canonical may round up to exactly 1.0.
    if (value >= 1.0) {
        value = std::nextafter(1.0, 0.0);
    }
    return value;
}

std::size_t Mt19937RandomSource::uniformIndex(std::size_t count) {
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(engine_);
}

} // namespace rsim::rating
