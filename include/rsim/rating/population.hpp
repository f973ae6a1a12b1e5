#pragma once

/// @file population.hpp
/// @brief Fixed-size, ordered collection owning every simulated player.

#include <cstddef>
#include <vector>

#include "rsim/rating/player.hpp"

namespace rsim::rating {

/// Exclusive owner of all Player objects of one simulation run.
///
/// The size is fixed at construction; players are never added or
/// removed, so references handed out stay valid for the population's
/// lifetime (moving the population keeps them valid as well).
/// Matchmaker and MatchSimulator only borrow players and must not
/// outlive the population.
class Population {
public:
    /// Create @p size players, all starting at @p initialRating.
    /// Player ids are 1-based in population order.
    Population(std::size_t size, double initialRating);

    /// Create one player per entry of @p initialRatings, in order.
    explicit Population(const std::vector<double>& initialRatings);

    Population(const Population&) = delete;
    Population& operator=(const Population&) = delete;
    Population(Population&&) noexcept = default;
    Population& operator=(Population&&) noexcept = default;

    [[nodiscard]] std::size_t size() const noexcept { return players_.size(); }
    [[nodiscard]] bool empty() const noexcept { return players_.empty(); }

    [[nodiscard]] Player& operator[](std::size_t index) { return players_[index]; }
    [[nodiscard]] const Player& operator[](std::size_t index) const { return players_[index]; }

    /// True if @p player is one of this population's members (identity check).
    [[nodiscard]] bool owns(const Player& player) const noexcept;

    /// Current rating of every player, in population order.
    [[nodiscard]] std::vector<double> ratings() const;

    [[nodiscard]] auto begin() noexcept { return players_.begin(); }
    [[nodiscard]] auto end() noexcept { return players_.end(); }
    [[nodiscard]] auto begin() const noexcept { return players_.begin(); }
    [[nodiscard]] auto end() const noexcept { return players_.end(); }

private:
    std::vector<Player> players_;
};

} // namespace rsim::rating
