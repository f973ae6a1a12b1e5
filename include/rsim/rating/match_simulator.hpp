#pragma once

/// @file match_simulator.hpp
/// @brief Stochastic match outcome and symmetric rating updates.

#include <cstdint>
#include <string_view>

#include "rsim/rating/player.hpp"
#include "rsim/rating/random_source.hpp"
#include "rsim/rating/rating_model.hpp"

namespace rsim::rating {

/// Which of the two participants won. Draws are never produced.
enum class MatchWinner : uint8_t {
    Player1 = 1,
    Player2 = 2
};

constexpr std::string_view toString(MatchWinner winner) {
    return winner == MatchWinner::Player1 ? "player1" : "player2";
}

/// Rating update parameters.
struct MatchSimulatorConfig {
    double kFactor = RatingModel::kDefaultKFactor;

    /// Matches during which a player's K-factor is boosted (0 = never).
    uint64_t provisionalMatches = 0;

    /// Boost applied inside the provisional window.
    double provisionalKMultiplier = 2.0;
};

/// Everything that happened in one resolved match.
struct MatchReport {
    MatchWinner winner = MatchWinner::Player1;
    double expectedScore1 = 0.5;  ///< Win probability of player1 before the match.
    double draw = 0.0;            ///< Outcome draw compared against expectedScore1.
    double delta1 = 0.0;          ///< Rating change applied to player1.
    double delta2 = 0.0;          ///< Rating change applied to player2.
};

/// Draws a match outcome from the Elo model and updates both players.
///
/// Both updates use the ratings captured before the match, so the final
/// ratings do not depend on which player is updated first. player1 is
/// always updated first.
class MatchSimulator {
public:
    explicit MatchSimulator(MatchSimulatorConfig config = {});

    /// Draw one uniform01() value from @p rng and resolve the match.
    /// @p player1 and @p player2 must be distinct players.
    MatchReport simulate(Player& player1, Player& player2, RandomSource& rng) const;

    /// Resolve the match for a given outcome draw in [0, 1):
    /// player1 wins iff @p draw < expectedScore(player1, player2).
    MatchReport resolve(Player& player1, Player& player2, double draw) const;

    [[nodiscard]] const MatchSimulatorConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] double kFactorFor(const Player& player) const;

    MatchSimulatorConfig config_;
};

} // namespace rsim::rating
