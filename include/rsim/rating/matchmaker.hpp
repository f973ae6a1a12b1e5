#pragma once

/// @file matchmaker.hpp
/// @brief Rating-proximity opponent selection with unconditional fallback.
///
/// The acceptable band for a subject rated R is
///   [R * (1 - pct), R * (1 + pct)]
/// computed from the signed rating. For a negative rating the bounds
/// swap order, the band is empty and every search falls back.

#include <vector>

#include "rsim/foundation/sim_result.hpp"
#include "rsim/rating/population.hpp"
#include "rsim/rating/random_source.hpp"

namespace rsim::rating {

/// Matchmaking configuration.
struct MatchmakerConfig {
    /// Half-width of the acceptable band as a fraction of the subject's rating.
    double ratingRangePercentage = 0.2;
};

/// Closed rating interval [minRating, maxRating].
struct RatingBand {
    double minRating = 0.0;
    double maxRating = 0.0;

    [[nodiscard]] bool contains(double rating) const noexcept {
        return minRating <= rating && rating <= maxRating;
    }
};

/// Opponent pool for one subject.
struct MatchCandidates {
    std::vector<Player*> players;  ///< Population order, subject excluded.
    bool usedFallback = false;     ///< True if no one was inside the band.
};

/// Selects opponents from a borrowed Population.
///
/// Usage:
/// @code
///   Matchmaker matchmaker(population, {.ratingRangePercentage = 0.2});
///   auto opponent = matchmaker.findMatch(population[0], rng);
///   if (opponent) { /* simulate against *opponent.value() */ }
/// @endcode
class Matchmaker {
public:
    /// Bind to @p population, which must outlive the matchmaker.
    explicit Matchmaker(Population& population, MatchmakerConfig config = {});

    /// Band for a subject currently rated @p rating.
    [[nodiscard]] static RatingBand bandFor(double rating, double ratingRangePercentage);

    /// Every member except @p subject whose rating lies inside the
    /// subject's band, or every member except @p subject if none does.
    [[nodiscard]] MatchCandidates candidates(const Player& subject) const;

    /// Pick an opponent uniformly from candidates(subject).
    ///
    /// Consumes exactly one uniformIndex() draw on success and none on
    /// failure.
    ///
    /// @return PreconditionViolation if the population has fewer than two
    ///         members, InvalidArgument if @p subject is not a member.
    [[nodiscard]] foundation::SimResult<Player*> findMatch(
        const Player& subject, RandomSource& rng) const;

    [[nodiscard]] const MatchmakerConfig& config() const noexcept { return config_; }

private:
    Population& population_;
    MatchmakerConfig config_;
};

} // namespace rsim::rating
