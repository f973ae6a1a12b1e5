/// @file rating_model.cpp
/// @brief RatingModel implementation.

#include "rsim/rating/rating_model.hpp"

#include <cmath>

namespace rsim::rating {

double RatingModel::expectedScore(double ratingA, double ratingB) {
    const double exponent = (ratingB - ratingA) / kLogisticScale;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

double RatingModel::ratingDelta(double expected, double actualScore,
                                double kFactor) {
    return kFactor * (actualScore - expected);
}

double RatingModel::effectiveKFactor(double baseKFactor,
                                     uint64_t matchesPlayed,
                                     uint64_t provisionalMatches,
                                     double provisionalMultiplier) {
    if (matchesPlayed < provisionalMatches) {
        return baseKFactor * provisionalMultiplier;
    }
    return baseKFactor;
}

} // namespace rsim::rating
