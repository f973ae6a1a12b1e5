#pragma once

/// @file rating_model.hpp
/// @brief Elo expected-score and rating-delta formulas.
///
/// Uses the standard Elo formula:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
///   delta = K * (S - E)

#include <cstdint>

namespace rsim::rating {

/// Static utility class for Elo rating calculations. Stateless.
class RatingModel {
public:
    RatingModel() = delete;

    /// Default K-factor for rating adjustments.
    static constexpr double kDefaultKFactor = 32.0;

    /// Rating difference that shifts the expected score by a factor of ten.
    static constexpr double kLogisticScale = 400.0;

    /// Actual score for a won match.
    static constexpr double kWinScore = 1.0;

    /// Actual score for a lost match.
    static constexpr double kLossScore = 0.0;

    /// Calculate the expected score for player A vs player B.
    ///
    /// expectedScore(A, B) + expectedScore(B, A) == 1 for all finite ratings.
    ///
    /// @param ratingA  Player A's current rating.
    /// @param ratingB  Player B's current rating.
    /// @return Win probability estimate for A, in (0.0, 1.0) for
    ///         differentials well beyond +/-2000.
    [[nodiscard]] static double expectedScore(double ratingA, double ratingB);

    /// Rating change for one match: kFactor * (actualScore - expected).
    ///
    /// @param expected     Expected score from expectedScore().
    /// @param actualScore  kWinScore or kLossScore.
    /// @param kFactor      Rating change sensitivity.
    [[nodiscard]] static double ratingDelta(
        double expected,
        double actualScore,
        double kFactor = kDefaultKFactor);

    /// K-factor for a player who has completed @p matchesPlayed matches.
    ///
    /// Players still inside the provisional window (fewer than
    /// @p provisionalMatches matches) get @p baseKFactor scaled by
    /// @p provisionalMultiplier. A window of zero disables the boost.
    [[nodiscard]] static double effectiveKFactor(
        double baseKFactor,
        uint64_t matchesPlayed,
        uint64_t provisionalMatches,
        double provisionalMultiplier);
};

} // namespace rsim::rating
