/// @file simulation_config.cpp
/// @brief SimulationConfig validation and YAML mapping.

#include "rsim/rating/simulation_config.hpp"

#include "rsim/foundation/sim_logger.hpp"

#include <cmath>
#include <string>
#include <string_view>

namespace rsim::rating {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;
using foundation::SimResult;

namespace {

SimResult<void> invalid(std::string message) {
    RSIM_LOG_ERROR(LogCategory::Config, message);
    return SimResult<void>::err(
        SimError(ErrorCode::InvalidConfiguration, std::move(message)));
}

/// Overwrite @p target with the value at @p key if the key is present.
template <typename T>
SimResult<void> readOptional(const ConfigManager& config, std::string_view key,
                             T& target) {
    if (!config.hasKey(key)) {
        return SimResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return SimResult<void>::err(
            SimError(ErrorCode::InvalidConfiguration,
                     std::string(value.error().message())));
    }
    target = value.value();
    return SimResult<void>::ok();
}

} // namespace

MatchmakerConfig SimulationConfig::matchmakerConfig() const {
    return MatchmakerConfig{.ratingRangePercentage = ratingRangePercentage};
}

MatchSimulatorConfig SimulationConfig::matchSimulatorConfig() const {
    return MatchSimulatorConfig{
        .kFactor = kFactor,
        .provisionalMatches = static_cast<uint64_t>(provisionalMatches),
        .provisionalKMultiplier = provisionalKMultiplier};
}

SimResult<void> validateConfig(const SimulationConfig& config) {
    if (config.numPlayers <= 0) {
        return invalid("num_players must be positive, got " +
                       std::to_string(config.numPlayers));
    }
    if (config.numMatches <= 0) {
        return invalid("num_matches must be positive, got " +
                       std::to_string(config.numMatches));
    }
    if (!std::isfinite(config.initialRating)) {
        return invalid("initial_rating must be finite");
    }
    if (!std::isfinite(config.ratingRangePercentage) ||
        config.ratingRangePercentage < 0.0 ||
        config.ratingRangePercentage > 1.0) {
        return invalid("rating_range_percentage must be within [0, 1], got " +
                       std::to_string(config.ratingRangePercentage));
    }
    if (!std::isfinite(config.kFactor) || config.kFactor <= 0.0) {
        return invalid("k_factor must be positive, got " +
                       std::to_string(config.kFactor));
    }
    if (config.provisionalMatches < 0) {
        return invalid("provisional_matches must not be negative");
    }
    if (!std::isfinite(config.provisionalKMultiplier) ||
        config.provisionalKMultiplier <= 0.0) {
        return invalid("provisional_k_multiplier must be positive");
    }
    return SimResult<void>::ok();
}

SimResult<SimulationConfig> loadSimulationConfig(const ConfigManager& config) {
    SimulationConfig cfg;

    const SimResult<void> reads[] = {
        readOptional(config, "simulation.num_players", cfg.numPlayers),
        readOptional(config, "simulation.num_matches", cfg.numMatches),
        readOptional(config, "simulation.initial_rating", cfg.initialRating),
        readOptional(config, "rating.k_factor", cfg.kFactor),
        readOptional(config, "rating.provisional_matches", cfg.provisionalMatches),
        readOptional(config, "rating.provisional_k_multiplier", cfg.provisionalKMultiplier),
        readOptional(config, "matchmaking.rating_range_percentage",
                     cfg.ratingRangePercentage),
    };
    for (const auto& read : reads) {
        if (!read) {
            RSIM_LOG_ERROR(LogCategory::Config, read.error().message());
            return SimResult<SimulationConfig>::err(read.error());
        }
    }

    if (config.hasKey("simulation.seed")) {
        auto seed = config.get<uint64_t>("simulation.seed");
        if (!seed) {
            return SimResult<SimulationConfig>::err(
                SimError(ErrorCode::InvalidConfiguration,
                         std::string(seed.error().message())));
        }
        cfg.seed = seed.value();
    }

    auto valid = validateConfig(cfg);
    if (!valid) {
        return SimResult<SimulationConfig>::err(valid.error());
    }
    return SimResult<SimulationConfig>::ok(cfg);
}

} // namespace rsim::rating
