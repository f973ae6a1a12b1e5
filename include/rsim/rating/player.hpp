#pragma once

/// @file player.hpp
/// @brief A simulated player: current rating, full rating history and
/// match counter.

#include <cstdint>
#include <vector>

#include "rsim/foundation/types.hpp"
#include "rsim/rating/rating_model.hpp"

namespace rsim::rating {

/// A player whose Elo rating evolves match by match.
///
/// Invariant: ratingHistory().size() == matchesPlayed() + 1. The first
/// history entry is the initial rating; update() appends one entry.
///
/// Players are identified by object identity inside a Population, so
/// copying is disabled.
class Player {
public:
    Player(foundation::PlayerId id, double initialRating);

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;
    Player(Player&&) noexcept = default;
    Player& operator=(Player&&) noexcept = default;

    /// Apply the result of one match against an opponent.
    ///
    /// @param opponentRating  Opponent's rating before the match.
    /// @param actualScore     RatingModel::kWinScore or kLossScore.
    /// @param kFactor         K-factor for this update.
    /// @return The rating delta that was applied.
    double update(double opponentRating, double actualScore,
                  double kFactor = RatingModel::kDefaultKFactor);

    [[nodiscard]] foundation::PlayerId id() const noexcept { return id_; }
    [[nodiscard]] double rating() const noexcept { return rating_; }
    [[nodiscard]] double initialRating() const noexcept { return ratingHistory_.front(); }
    [[nodiscard]] const std::vector<double>& ratingHistory() const noexcept {
        return ratingHistory_;
    }
    [[nodiscard]] uint64_t matchesPlayed() const noexcept { return matchesPlayed_; }

private:
    foundation::PlayerId id_;
    double rating_;
    std::vector<double> ratingHistory_;
    uint64_t matchesPlayed_ = 0;
};

} // namespace rsim::rating
