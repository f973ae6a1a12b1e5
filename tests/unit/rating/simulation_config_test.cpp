/// @file simulation_config_test.cpp
/// @brief Unit tests for SimulationConfig validation and YAML mapping.

#include <gtest/gtest.h>

#include <limits>

#include "rsim/foundation/config_manager.hpp"
#include "rsim/rating/simulation_config.hpp"

using namespace rsim::rating;
using rsim::foundation::ConfigManager;
using rsim::foundation::ErrorCode;

TEST(SimulationConfigTest, Defaults) {
    SimulationConfig cfg;
    EXPECT_EQ(cfg.numPlayers, 50);
    EXPECT_EQ(cfg.numMatches, 10000);
    EXPECT_DOUBLE_EQ(cfg.initialRating, 1500.0);
    EXPECT_DOUBLE_EQ(cfg.ratingRangePercentage, 0.2);
    EXPECT_DOUBLE_EQ(cfg.kFactor, 32.0);
    EXPECT_EQ(cfg.provisionalMatches, 0);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_TRUE(validateConfig(cfg).hasValue());
}

TEST(SimulationConfigTest, DerivedComponentConfigs) {
    SimulationConfig cfg;
    cfg.ratingRangePercentage = 0.35;
    cfg.kFactor = 24.0;
    cfg.provisionalMatches = 10;
    cfg.provisionalKMultiplier = 1.5;

    EXPECT_DOUBLE_EQ(cfg.matchmakerConfig().ratingRangePercentage, 0.35);
    auto sim = cfg.matchSimulatorConfig();
    EXPECT_DOUBLE_EQ(sim.kFactor, 24.0);
    EXPECT_EQ(sim.provisionalMatches, 10u);
    EXPECT_DOUBLE_EQ(sim.provisionalKMultiplier, 1.5);
}

class ValidateConfigTest : public ::testing::Test {
protected:
    static void expectInvalid(const SimulationConfig& cfg) {
        auto result = validateConfig(cfg);
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidConfiguration);
    }
};

TEST_F(ValidateConfigTest, NonPositiveCounts) {
    SimulationConfig cfg;
    cfg.numPlayers = 0;
    expectInvalid(cfg);
    cfg.numPlayers = -3;
    expectInvalid(cfg);

    cfg = SimulationConfig{};
    cfg.numMatches = 0;
    expectInvalid(cfg);
}

TEST_F(ValidateConfigTest, SinglePlayerPassesValidation) {
    // Reported later, when matchmaking is attempted.
    SimulationConfig cfg;
    cfg.numPlayers = 1;
    EXPECT_TRUE(validateConfig(cfg).hasValue());
}

TEST_F(ValidateConfigTest, RatingRangePercentage) {
    SimulationConfig cfg;
    cfg.ratingRangePercentage = 0.0;
    EXPECT_TRUE(validateConfig(cfg).hasValue());
    cfg.ratingRangePercentage = 1.0;
    EXPECT_TRUE(validateConfig(cfg).hasValue());

    cfg.ratingRangePercentage = -0.1;
    expectInvalid(cfg);
    cfg.ratingRangePercentage = 1.5;
    expectInvalid(cfg);
    cfg.ratingRangePercentage = std::numeric_limits<double>::quiet_NaN();
    expectInvalid(cfg);
}

TEST_F(ValidateConfigTest, KFactorMustBePositive) {
    SimulationConfig cfg;
    cfg.kFactor = 0.0;
    expectInvalid(cfg);
    cfg.kFactor = -32.0;
    expectInvalid(cfg);
    cfg.kFactor = std::numeric_limits<double>::infinity();
    expectInvalid(cfg);
}

TEST_F(ValidateConfigTest, InitialRatingMustBeFinite) {
    SimulationConfig cfg;
    cfg.initialRating = -200.0;
    EXPECT_TRUE(validateConfig(cfg).hasValue());
    cfg.initialRating = std::numeric_limits<double>::infinity();
    expectInvalid(cfg);
}

TEST_F(ValidateConfigTest, ProvisionalSettings) {
    SimulationConfig cfg;
    cfg.provisionalMatches = -1;
    expectInvalid(cfg);

    cfg = SimulationConfig{};
    cfg.provisionalKMultiplier = 0.0;
    expectInvalid(cfg);
}

TEST(LoadSimulationConfigTest, ReadsAllKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
simulation:
  num_players: 1000
  num_matches: 100000
  initial_rating: 1200
  seed: 42
rating:
  k_factor: 16
  provisional_matches: 10
  provisional_k_multiplier: 2.5
matchmaking:
  rating_range_percentage: 0.1
)").hasValue());

    auto cfg = loadSimulationConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().numPlayers, 1000);
    EXPECT_EQ(cfg.value().numMatches, 100000);
    EXPECT_DOUBLE_EQ(cfg.value().initialRating, 1200.0);
    ASSERT_TRUE(cfg.value().seed.has_value());
    EXPECT_EQ(*cfg.value().seed, 42u);
    EXPECT_DOUBLE_EQ(cfg.value().kFactor, 16.0);
    EXPECT_EQ(cfg.value().provisionalMatches, 10);
    EXPECT_DOUBLE_EQ(cfg.value().provisionalKMultiplier, 2.5);
    EXPECT_DOUBLE_EQ(cfg.value().ratingRangePercentage, 0.1);
}

TEST(LoadSimulationConfigTest, MissingKeysKeepDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("simulation:\n  num_players: 8\n").hasValue());

    auto cfg = loadSimulationConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().numPlayers, 8);
    EXPECT_EQ(cfg.value().numMatches, 10000);
    EXPECT_DOUBLE_EQ(cfg.value().kFactor, 32.0);
    EXPECT_FALSE(cfg.value().seed.has_value());
}

TEST(LoadSimulationConfigTest, EmptyConfigUsesDefaults) {
    ConfigManager config;
    auto cfg = loadSimulationConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().numPlayers, 50);
}

TEST(LoadSimulationConfigTest, WrongTypeIsInvalidConfiguration) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("rating:\n  k_factor: steep\n").hasValue());

    auto cfg = loadSimulationConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidConfiguration);
}

TEST(LoadSimulationConfigTest, OutOfRangeValueIsInvalidConfiguration) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "matchmaking:\n  rating_range_percentage: -0.5\n").hasValue());

    auto cfg = loadSimulationConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidConfiguration);
}
