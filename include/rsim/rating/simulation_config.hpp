#pragma once

/// @file simulation_config.hpp
/// @brief Parameters of one simulation run, their validation and their
/// mapping from YAML configuration.
///
/// Recognised keys (all optional):
/// | Key                                   | Default  |
/// |---------------------------------------|----------|
/// | simulation.num_players                | 50       |
/// | simulation.num_matches                | 10000    |
/// | simulation.initial_rating             | 1500     |
/// | simulation.seed                       | (random) |
/// | rating.k_factor                       | 32       |
/// | rating.provisional_matches            | 0        |
/// | rating.provisional_k_multiplier       | 2.0      |
/// | matchmaking.rating_range_percentage   | 0.2      |

#include <cstdint>
#include <optional>

#include "rsim/foundation/config_manager.hpp"
#include "rsim/foundation/sim_result.hpp"
#include "rsim/rating/match_simulator.hpp"
#include "rsim/rating/matchmaker.hpp"

namespace rsim::rating {

/// Configuration of one simulation run.
struct SimulationConfig {
    int64_t numPlayers = 50;
    int64_t numMatches = 10000;
    double initialRating = 1500.0;
    double ratingRangePercentage = 0.2;
    double kFactor = RatingModel::kDefaultKFactor;
    int64_t provisionalMatches = 0;
    double provisionalKMultiplier = 2.0;

    /// Absent means a nondeterministic seed is drawn at run time.
    std::optional<uint64_t> seed;

    [[nodiscard]] MatchmakerConfig matchmakerConfig() const;
    [[nodiscard]] MatchSimulatorConfig matchSimulatorConfig() const;
};

/// Check every parameter.
///
/// A zero ratingRangePercentage is legal (the band collapses to the
/// subject's exact rating); negative values or values above one are not.
///
/// @return InvalidConfiguration naming the first offending parameter.
[[nodiscard]] foundation::SimResult<void> validateConfig(const SimulationConfig& config);

/// Build and validate a SimulationConfig from loaded YAML.
///
/// Missing keys keep their defaults; a key of the wrong type is an
/// InvalidConfiguration error.
[[nodiscard]] foundation::SimResult<SimulationConfig> loadSimulationConfig(
    const foundation::ConfigManager& config);

} // namespace rsim::rating
