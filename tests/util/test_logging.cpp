// FEEDROUTE - Logging Tests
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <gtest/gtest.h>

#include <feedroute/util/logging.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace feedroute {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    /// Attach a sink that records every entry it receives
    std::vector<LogEntry>& Capture(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return captured_;
    }

    std::vector<LogEntry> captured_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info); // Default
}

TEST_F(LoggingTest, TryParseLogLevelRejectsUnknown) {
    LogLevel level = LogLevel::Error;
    EXPECT_FALSE(TryParseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_TRUE(TryParseLogLevel("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::REGISTRY));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::REGISTRY));

    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.WillLog(LogLevel::Fatal, LogCategory::REGISTRY));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();

    logger.DisableAllCategories();
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::PROOF));

    logger.EnableCategory(LogCategory::PROOF);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::PROOF));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::FEES));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::FEES));
}

TEST_F(LoggingTest, StreamMacroEmitsOnDestruction) {
    auto& entries = Capture();

    LOG_INFO(LogCategory::ALIAS) << "Alias set: " << 1 << " -> " << 2;

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "Alias set: 1 -> 2");
    EXPECT_EQ(entries[0].category, LogCategory::ALIAS);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_GT(entries[0].line, 0);
}

TEST_F(LoggingTest, StreamMacroRespectsLevel) {
    auto& entries = Capture();
    LOG_DEBUG(LogCategory::RESOLVER) << "hidden";
    EXPECT_TRUE(entries.empty());

    Logger::Instance().SetLevel(LogLevel::Debug);
    LOG_DEBUG(LogCategory::RESOLVER) << "shown";
    EXPECT_EQ(entries.size(), 1u);
}

TEST_F(LoggingTest, PrintfStyleMacro) {
    auto& entries = Capture();
    LogWarnF(LogCategory::CONFIG, "bad value %d for %s", 7, "protocolid");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "bad value 7 for protocolid");
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
}

TEST_F(LoggingTest, CallbackSinkLevel) {
    auto& entries = Capture(LogLevel::Error);
    Logger::Instance().Log(LogLevel::Warn, LogCategory::DEFAULT, "warn");
    Logger::Instance().Log(LogLevel::Error, LogCategory::DEFAULT, "error");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "error");
}

TEST_F(LoggingTest, ConsoleSinkFormat) {
    ConsoleSink::Config config;
    config.useColors = false;
    config.showTimestamp = false;

    ConsoleSink sink(config);

    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::REGISTRY;
    entry.message = "rejected";
    EXPECT_EQ(sink.Format(entry), "[WARN ] [registry] rejected");

    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(sink.Format(entry), "[WARN ] rejected");
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST(LogUtilityTest, FormatLogTimestamp) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1704067200));
    EXPECT_EQ(FormatLogTimestamp(tp), "2024-01-01T00:00:00.000Z");
}

TEST(LogUtilityTest, FixedWidth) {
    EXPECT_EQ(FixedWidth("test", 6), "test  ");
    EXPECT_EQ(FixedWidth("testing", 4), "test");
    EXPECT_EQ(FixedWidth("hi", 5, '-'), "hi---");
}

TEST(LogUtilityTest, GetBasename) {
    EXPECT_EQ(GetBasename("/usr/local/src/registry.cpp"), "registry.cpp");
    EXPECT_EQ(GetBasename("registry.cpp"), "registry.cpp");
    EXPECT_EQ(GetBasename("/"), "");
}

} // namespace
} // namespace util
} // namespace feedroute
