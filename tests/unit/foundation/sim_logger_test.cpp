#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "rsim/foundation/error_code.hpp"
#include "rsim/foundation/sim_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace rsim::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

class SimLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// Names and parsing
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(LogCategory::Rating), "Rating");
    EXPECT_EQ(logCategoryName(LogCategory::Matchmaking), "Matchmaking");
    EXPECT_EQ(logCategoryName(LogCategory::Simulation), "Simulation");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, ParseKnownNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
}

TEST(LogLevelTest, ParseUnknownNameFails) {
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

// ---------------------------------------------------------------------------
// Filtering
// ---------------------------------------------------------------------------

TEST(SimLoggerBasicTest, DefaultCategoryLevelsAreInfo) {
    SimLogger logger;
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        EXPECT_EQ(logger.getCategoryLevel(static_cast<LogCategory>(i)), LogLevel::Info);
    }
}

TEST(SimLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    SimLogger logger;
    logger.setCategoryLevel(LogCategory::Matchmaking, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Matchmaking));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Rating));

    logger.setCategoryLevel(LogCategory::Matchmaking, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Matchmaking));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Matchmaking));
}

TEST(SimLoggerBasicTest, SetAllCategoryLevels) {
    SimLogger logger;
    logger.setAllCategoryLevels(LogLevel::Off);
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, static_cast<LogCategory>(i)));
    }
}

TEST(SimLoggerBasicTest, InvalidCategoryReturnsOff) {
    SimLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(SimLoggerTest, LogFormatsMessageWithCategory) {
    SimLogger logger;
    logger.log(LogLevel::Info, LogCategory::Simulation, "Simulation starting");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Simulation] Simulation starting");
}

TEST_F(SimLoggerTest, LogFiltersMessagesBelowLevel) {
    SimLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Matchmaking, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(SimLoggerTest, LogWithContextIncludesFields) {
    SimLogger logger;
    logger.setCategoryLevel(LogCategory::Rating, LogLevel::Trace);

    LogContext ctx;
    ctx.playerId = PlayerId(7);
    ctx.runId = "seed-42";
    ctx.extra["delta1"] = "16.000000";

    logger.logWithContext(LogLevel::Trace, LogCategory::Rating, "Match resolved", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Rating] Match resolved {"), std::string::npos);
    EXPECT_NE(msg.find("player_id=7"), std::string::npos);
    EXPECT_NE(msg.find("run_id=seed-42"), std::string::npos);
    EXPECT_NE(msg.find("delta1=16.000000"), std::string::npos);
}

TEST_F(SimLoggerTest, LogWithEmptyContextOmitsBraces) {
    SimLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "plain", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] plain");
}

TEST_F(SimLoggerTest, FlushReachesDefaultLogger) {
    SimLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    SimError err(ErrorCode::LoggerFlushFailed, "test");
    EXPECT_EQ(err.subsystem(), "Logger");
}
