/// @file match_simulator.cpp
/// @brief MatchSimulator implementation.

#include "rsim/rating/match_simulator.hpp"

#include "rsim/foundation/sim_logger.hpp"

#include <string>

namespace rsim::rating {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SimLogger;

MatchSimulator::MatchSimulator(MatchSimulatorConfig config)
    : config_(config) {}

double MatchSimulator::kFactorFor(const Player& player) const {
    return RatingModel::effectiveKFactor(config_.kFactor,
                                         player.matchesPlayed(),
                                         config_.provisionalMatches,
                                         config_.provisionalKMultiplier);
}

MatchReport MatchSimulator::simulate(Player& player1, Player& player2,
                                     RandomSource& rng) const {
    return resolve(player1, player2, rng.uniform01());
}

MatchReport MatchSimulator::resolve(Player& player1, Player& player2,
                                    double draw) const {
    // Snapshot pre-match state; both updates read these values.
    const double rating1 = player1.rating();
    const double rating2 = player2.rating();
    const double k1 = kFactorFor(player1);
    const double k2 = kFactorFor(player2);

    MatchReport report;
    report.expectedScore1 = RatingModel::expectedScore(rating1, rating2);
    report.draw = draw;

    if (draw < report.expectedScore1) {
        report.winner = MatchWinner::Player1;
        report.delta1 = player1.update(rating2, RatingModel::kWinScore, k1);
        report.delta2 = player2.update(rating1, RatingModel::kLossScore, k2);
    } else {
        report.winner = MatchWinner::Player2;
        report.delta1 = player1.update(rating2, RatingModel::kLossScore, k1);
        report.delta2 = player2.update(rating1, RatingModel::kWinScore, k2);
    }

    auto& logger = SimLogger::instance();
    if (logger.isEnabled(LogLevel::Trace, LogCategory::Rating)) {
        LogContext ctx;
        ctx.playerId = player1.id();
        ctx.extra["opponent_id"] = std::to_string(player2.id().value());
        ctx.extra["winner"] = std::string(toString(report.winner));
        ctx.extra["delta1"] = std::to_string(report.delta1);
        ctx.extra["delta2"] = std::to_string(report.delta2);
        logger.logWithContext(LogLevel::Trace, LogCategory::Rating,
                              "Match resolved", ctx);
    }
    return report;
}

} // namespace rsim::rating
