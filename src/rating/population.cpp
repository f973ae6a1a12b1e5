/// @file population.cpp
/// @brief Population implementation.

#include "rsim/rating/population.hpp"

#include <functional>

namespace rsim::rating {

Population::Population(std::size_t size, double initialRating) {
    players_.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        players_.emplace_back(foundation::PlayerId(i + 1), initialRating);
    }
}

Population::Population(const std::vector<double>& initialRatings) {
    players_.reserve(initialRatings.size());
    for (std::size_t i = 0; i < initialRatings.size(); ++i) {
        players_.emplace_back(foundation::PlayerId(i + 1), initialRatings[i]);
    }
}

bool Population::owns(const Player& player) const noexcept {
    if (players_.empty()) {
        return false;
    }
    const Player* first = players_.data();
    const Player* last = first + players_.size();
    std::less<const Player*> before;
    return !before(&player, first) && before(&player, last);
}

std::vector<double> Population::ratings() const {
    std::vector<double> out;
    out.reserve(players_.size());
    for (const auto& p : players_) {
        out.push_back(p.rating());
    }
    return out;
}

} // namespace rsim::rating
