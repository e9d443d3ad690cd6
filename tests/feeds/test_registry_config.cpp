// FEEDROUTE - Registry Configuration Tests
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <gtest/gtest.h>

#include <feedroute/feeds/registry_config.h>

namespace feedroute {
namespace feeds {
namespace {

class RegistryConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        util::Logger& logger = util::Logger::Instance();
        logger.SetLevel(util::LogLevel::Info);
        logger.EnableAllCategories();
    }

    util::ConfigManager manager_;
    RegistryConfig config_;
};

TEST_F(RegistryConfigTest, Defaults) {
    ASSERT_TRUE(LoadRegistryConfig(manager_, config_).success);
    EXPECT_EQ(config_.protocolId, FTSO_PROTOCOL_ID);
    EXPECT_EQ(config_.logLevel, util::LogLevel::Info);
    EXPECT_TRUE(config_.debugCategories.empty());
    EXPECT_TRUE(config_.logColors);
}

TEST_F(RegistryConfigTest, ReadsAllKeys) {
    manager_.ParseString(
        "protocolid=7\n"
        "loglevel=debug\n"
        "debug=registry,fees\n"
        "logcolors=0\n");

    ASSERT_TRUE(LoadRegistryConfig(manager_, config_).success);
    EXPECT_EQ(config_.protocolId, 7);
    EXPECT_EQ(config_.logLevel, util::LogLevel::Debug);
    EXPECT_EQ(config_.debugCategories, std::vector<std::string>({"registry", "fees"}));
    EXPECT_FALSE(config_.logColors);
}

TEST_F(RegistryConfigTest, RepeatedDebugKeysAccumulate) {
    manager_.ParseString("debug=proof\ndebug=alias\n");
    ASSERT_TRUE(LoadRegistryConfig(manager_, config_).success);
    EXPECT_EQ(config_.debugCategories, std::vector<std::string>({"proof", "alias"}));
}

TEST_F(RegistryConfigTest, DebugAllClearsFilter) {
    manager_.ParseString("debug=registry,all\n");
    ASSERT_TRUE(LoadRegistryConfig(manager_, config_).success);
    EXPECT_TRUE(config_.debugCategories.empty());
}

TEST_F(RegistryConfigTest, ProtocolIdOutOfRange) {
    manager_.ParseString("\nprotocolid=256\n", "feedroute.conf");
    auto result = LoadRegistryConfig(manager_, config_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "feedroute.conf");
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_NE(result.errorMessage.find("protocolid"), std::string::npos);
}

TEST_F(RegistryConfigTest, ProtocolIdNotANumber) {
    manager_.Set("protocolid", "ftso");
    EXPECT_FALSE(LoadRegistryConfig(manager_, config_).success);
}

TEST_F(RegistryConfigTest, UnknownLogLevel) {
    manager_.Set("loglevel", "chatty");
    EXPECT_FALSE(LoadRegistryConfig(manager_, config_).success);
}

TEST_F(RegistryConfigTest, UnknownCategory) {
    manager_.Set("debug", "registry,mempool");
    auto result = LoadRegistryConfig(manager_, config_);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("mempool"), std::string::npos);
}

TEST_F(RegistryConfigTest, InvalidBoolean) {
    manager_.Set("logcolors", "sometimes");
    EXPECT_FALSE(LoadRegistryConfig(manager_, config_).success);
}

TEST_F(RegistryConfigTest, CommandLineOverridesFile) {
    const char* argv[] = {"feedroute-util", "-protocolid=12"};
    manager_.ParseCommandLine(2, argv);
    manager_.ParseString("protocolid=50\n");

    ASSERT_TRUE(LoadRegistryConfig(manager_, config_).success);
    EXPECT_EQ(config_.protocolId, 12);
}

TEST_F(RegistryConfigTest, ApplyLoggingConfig) {
    config_.logLevel = util::LogLevel::Warn;
    config_.debugCategories = {util::LogCategory::PROOF};
    ApplyLoggingConfig(config_);

    util::Logger& logger = util::Logger::Instance();
    EXPECT_EQ(logger.GetLevel(), util::LogLevel::Warn);
    EXPECT_TRUE(logger.IsCategoryEnabled(util::LogCategory::PROOF));
    EXPECT_FALSE(logger.IsCategoryEnabled(util::LogCategory::FEES));

    config_.debugCategories.clear();
    ApplyLoggingConfig(config_);
    EXPECT_TRUE(logger.IsCategoryEnabled(util::LogCategory::FEES));
}

TEST_F(RegistryConfigTest, ConsoleSinkFollowsConfig) {
    config_.logColors = false;
    config_.logLevel = util::LogLevel::Error;
    auto sink = MakeConsoleSink(config_);
    EXPECT_FALSE(sink->GetConfig().useColors);
    EXPECT_EQ(sink->GetLevel(), util::LogLevel::Error);
}

} // namespace
} // namespace feeds
} // namespace feedroute
