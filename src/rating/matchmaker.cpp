/// @file matchmaker.cpp
/// @brief Matchmaker implementation.

#include "rsim/rating/matchmaker.hpp"

#include "rsim/foundation/sim_logger.hpp"

#include <string>

namespace rsim::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;
using foundation::SimResult;

Matchmaker::Matchmaker(Population& population, MatchmakerConfig config)
    : population_(population), config_(config) {}

RatingBand Matchmaker::bandFor(double rating, double ratingRangePercentage) {
    return RatingBand{rating * (1.0 - ratingRangePercentage),
                      rating * (1.0 + ratingRangePercentage)};
}

MatchCandidates Matchmaker::candidates(const Player& subject) const {
    MatchCandidates out;
    out.players.reserve(population_.size());

    const auto band = bandFor(subject.rating(), config_.ratingRangePercentage);
    for (auto& p : population_) {
        if (&p != &subject && band.contains(p.rating())) {
            out.players.push_back(&p);
        }
    }

    if (out.players.empty()) {
        out.usedFallback = true;
        for (auto& p : population_) {
            if (&p != &subject) {
                out.players.push_back(&p);
            }
        }
    }
    return out;
}

SimResult<Player*> Matchmaker::findMatch(const Player& subject,
                                         RandomSource& rng) const {
    if (population_.size() < 2) {
        RSIM_LOG_ERROR(LogCategory::Matchmaking,
                       "Matchmaking needs at least two players, population has " +
                           std::to_string(population_.size()));
        return SimResult<Player*>::err(
            SimError(ErrorCode::PreconditionViolation,
                     "population has fewer than two players; no opponent exists"));
    }
    if (!population_.owns(subject)) {
        return SimResult<Player*>::err(
            SimError(ErrorCode::InvalidArgument,
                     "subject is not a member of the matchmaking population"));
    }

    auto pool = candidates(subject);
    if (pool.usedFallback) {
        RSIM_LOG_DEBUG(LogCategory::Matchmaking,
                       "No opponent in band for player " +
                           std::to_string(subject.id().value()) +
                           ", falling back to full population");
    }

    auto* opponent = pool.players[rng.uniformIndex(pool.players.size())];
    return SimResult<Player*>::ok(opponent);
}

} // namespace rsim::rating
