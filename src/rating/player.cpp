/// @file player.cpp
/// @brief Player implementation.

#include "rsim/rating/player.hpp"

namespace rsim::rating {

Player::Player(foundation::PlayerId id, double initialRating)
    : id_(id), rating_(initialRating), ratingHistory_{initialRating} {}

double Player::update(double opponentRating, double actualScore,
                      double kFactor) {
    const double expected = RatingModel::expectedScore(rating_, opponentRating);
    const double delta = RatingModel::ratingDelta(expected, actualScore, kFactor);

    rating_ += delta;
    ratingHistory_.push_back(rating_);
    ++matchesPlayed_;
    return delta;
}

} // namespace rsim::rating
