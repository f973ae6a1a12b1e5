/// @file simulation_driver.cpp
/// @brief SimulationDriver implementation.

#include "rsim/rating/simulation_driver.hpp"

#include "rsim/foundation/sim_logger.hpp"
#include "rsim/rating/matchmaker.hpp"

#include <algorithm>
#include <string>

namespace rsim::rating {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SimLogger;
using foundation::SimResult;

std::size_t SimulationResult::subjectWins() const {
    return static_cast<std::size_t>(std::count_if(
        outcomes.begin(), outcomes.end(),
        [](const MatchOutcome& o) { return o.winner == MatchWinner::Player1; }));
}

std::size_t SimulationResult::opponentWins() const {
    return outcomes.size() - subjectWins();
}

SimulationDriver::SimulationDriver(SimulationConfig config)
    : config_(std::move(config)) {}

SimResult<SimulationResult> SimulationDriver::run() const {
    Mt19937RandomSource rng(config_.seed);
    return run(rng);
}

SimResult<SimulationResult> SimulationDriver::run(RandomSource& rng) const {
    auto valid = validateConfig(config_);
    if (!valid) {
        return SimResult<SimulationResult>::err(valid.error());
    }

    auto& logger = SimLogger::instance();
    {
        LogContext ctx;
        ctx.extra["num_players"] = std::to_string(config_.numPlayers);
        ctx.extra["num_matches"] = std::to_string(config_.numMatches);
        ctx.extra["k_factor"] = std::to_string(config_.kFactor);
        ctx.extra["rating_range_percentage"] =
            std::to_string(config_.ratingRangePercentage);
        logger.logWithContext(LogLevel::Info, LogCategory::Simulation,
                              "Simulation starting", ctx);
    }

    SimulationResult result{
        Population(static_cast<std::size_t>(config_.numPlayers), config_.initialRating),
        {}};
    result.outcomes.reserve(static_cast<std::size_t>(config_.numMatches));

    auto& population = result.population;
    Matchmaker matchmaker(population, config_.matchmakerConfig());
    MatchSimulator simulator(config_.matchSimulatorConfig());

    const auto numMatches = static_cast<uint64_t>(config_.numMatches);
    for (uint64_t round = 0; round < numMatches; ++round) {
        Player& subject = population[rng.uniformIndex(population.size())];

        auto opponent = matchmaker.findMatch(subject, rng);
        if (!opponent) {
            RSIM_LOG_ERROR(LogCategory::Simulation,
                           "Simulation aborted at round " + std::to_string(round) +
                               ": " + std::string(opponent.error().message()));
            return SimResult<SimulationResult>::err(opponent.error());
        }

        auto report = simulator.simulate(subject, *opponent.value(), rng);
        result.outcomes.push_back(
            MatchOutcome{round, subject.id(), opponent.value()->id(), report.winner});

        RSIM_LOG_TRACE(LogCategory::Simulation,
                       "Round " + std::to_string(round) + ": player " +
                           std::to_string(subject.id().value()) + " vs player " +
                           std::to_string(opponent.value()->id().value()) + ", " +
                           std::string(toString(report.winner)) + " won");
    }

    {
        LogContext ctx;
        ctx.extra["subject_wins"] = std::to_string(result.subjectWins());
        ctx.extra["opponent_wins"] = std::to_string(result.opponentWins());
        logger.logWithContext(LogLevel::Info, LogCategory::Simulation,
                              "Simulation finished", ctx);
    }
    return SimResult<SimulationResult>::ok(std::move(result));
}

} // namespace rsim::rating
