/**
 * @file LoggerTest.cpp
 * @brief Unit tests for the logger sinks
 */

#include "util/Logger.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockLogger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <format>
#include <fstream>
#include <sstream>

using ::testing::HasSubstr;

namespace {

auto ReadText(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    TempTestDir dir;
    util::Logger logger;

    void SetUp() override { ASSERT_TRUE(dir.valid()); }

    void TearDown() override { logger.shutdown(); }
};

TEST_F(LoggerTest, Initialize_CreatesLogFile) {
    ASSERT_TRUE(logger.initialize(dir.path() / "logs", "unit"));
    EXPECT_TRUE(logger.is_initialized());
    EXPECT_EQ(logger.get_log_file_path(), dir.path() / "logs" / "unit.log");
    EXPECT_TRUE(std::filesystem::exists(logger.get_log_file_path()));
}

TEST_F(LoggerTest, Log_WritesLevelComponentAndMessage) {
    ASSERT_TRUE(logger.initialize(dir.path(), "unit"));
    logger.warning("Overwriter", "short write");
    logger.flush();

    auto text = ReadText(logger.get_log_file_path());
    EXPECT_THAT(text, HasSubstr("WARN"));
    EXPECT_THAT(text, HasSubstr("[Overwriter]"));
    EXPECT_THAT(text, HasSubstr("short write"));
}

TEST_F(LoggerTest, Log_BelowMinLevel_IsDropped) {
    ASSERT_TRUE(logger.initialize(dir.path(), "unit", util::LogLevel::WARNING));
    logger.info("Test", "should not appear");
    logger.error("Test", "should appear");
    logger.flush();

    auto text = ReadText(logger.get_log_file_path());
    EXPECT_THAT(text, ::testing::Not(HasSubstr("should not appear")));
    EXPECT_THAT(text, HasSubstr("should appear"));
}

TEST_F(LoggerTest, Rotation_KeepsBoundedFileCount) {
    ASSERT_TRUE(logger.initialize(dir.path(), "unit", util::LogLevel::DEBUG,
                                  util::LogRotationPolicy{.max_file_size_bytes = 512,
                                                          .max_files = 2}));
    for (int i = 0; i < 200; ++i) {
        logger.info("Test", std::format("line {} with some padding text", i));
    }
    logger.flush();

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "unit.log"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "unit.1.log"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "unit.3.log"));
}

TEST(ScopedLoggerTest, PrefixesEveryMessage) {
    auto inner = std::make_shared<MockLogger>();
    EXPECT_CALL(*inner, log(util::LogLevel::INFO, std::string_view("Comp"),
                            std::string_view("[abcd] hello")));

    util::ScopedLogger scoped(inner, "abcd");
    scoped.info("Comp", "hello");
}

TEST(NullLoggerTest, SharedInstanceIsStable) {
    EXPECT_EQ(util::NullLogger::shared(), util::NullLogger::shared());
    EXPECT_NO_THROW(util::NullLogger::shared()->error("Test", "discarded"));
}
