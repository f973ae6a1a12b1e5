#pragma once

/// @file simulation_driver.hpp
/// @brief Sequential Monte Carlo loop: subject draw, matchmaking, match
/// simulation, outcome recording.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rsim/foundation/sim_result.hpp"
#include "rsim/foundation/types.hpp"
#include "rsim/rating/match_simulator.hpp"
#include "rsim/rating/population.hpp"
#include "rsim/rating/random_source.hpp"
#include "rsim/rating/simulation_config.hpp"

namespace rsim::rating {

/// Record of one simulated round.
struct MatchOutcome {
    uint64_t round = 0;                 ///< 0-based round index.
    foundation::PlayerId subject;       ///< Player drawn uniformly (player1).
    foundation::PlayerId opponent;      ///< Player chosen by the matchmaker (player2).
    MatchWinner winner = MatchWinner::Player1;
};

/// Final state of a run: the population after all updates and the
/// ordered results log (one entry per round).
struct SimulationResult {
    Population population;
    std::vector<MatchOutcome> outcomes;

    [[nodiscard]] std::size_t subjectWins() const;
    [[nodiscard]] std::size_t opponentWins() const;
};

/// Runs numMatches rounds over a freshly built population.
///
/// Rounds are strictly sequential: round i+1 observes every rating
/// change made in round i. Each round consumes three draws from the
/// random source, in order: subject, opponent, outcome.
///
/// Usage:
/// @code
///   SimulationDriver driver(config);
///   Mt19937RandomSource rng(42);
///   auto result = driver.run(rng);
/// @endcode
class SimulationDriver {
public:
    explicit SimulationDriver(SimulationConfig config);

    /// Run with an explicit random source.
    ///
    /// @return InvalidConfiguration before any work if the configuration
    ///         is invalid; PreconditionViolation if matchmaking finds no
    ///         opponent (population smaller than two).
    [[nodiscard]] foundation::SimResult<SimulationResult> run(RandomSource& rng) const;

    /// Run with an Mt19937RandomSource seeded from config().seed.
    [[nodiscard]] foundation::SimResult<SimulationResult> run() const;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

private:
    SimulationConfig config_;
};

} // namespace rsim::rating
