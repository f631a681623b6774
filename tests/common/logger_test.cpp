// =============================================================================
// sff-codec - Logger Tests
// =============================================================================

#include "sffc/common/logger.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace sffc::log {
namespace {

TEST(LoggerTest, LevelNamesRoundTrip) {
    for (const Level level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                              Level::kError, Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

TEST(LoggerTest, LevelParsingIsCaseInsensitive) {
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("Warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
    EXPECT_EQ(levelFromString("verbose"), Level::kInfo);
}

TEST(LoggerTest, QuillLevels) {
    EXPECT_EQ(toQuillLevel(Level::kTrace), quill::LogLevel::TraceL1);
    EXPECT_EQ(toQuillLevel(Level::kWarning), quill::LogLevel::Warning);
    EXPECT_EQ(toQuillLevel(Level::kCritical), quill::LogLevel::Critical);
}

// Must run before any test that calls init()
TEST(LoggerTest, MacrosAreSafeBeforeInit) {
    ASSERT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    SFFC_LOG_WARNING("Discarded {} before init", 1);
    SFFC_LOG_DEBUG("Discarded without arguments");
    EXPECT_NO_THROW(setLevel(Level::kTrace));
    EXPECT_NO_THROW(flush());
    EXPECT_NO_THROW(shutdown());
}

TEST(LoggerTest, EnvironmentWithoutLevelLeavesLoggingOff) {
    ::unsetenv(kLevelEnvVar);
    EXPECT_FALSE(initFromEnvironment());

    ::setenv(kLevelEnvVar, "chatty", 1);
    EXPECT_FALSE(initFromEnvironment());
    ::unsetenv(kLevelEnvVar);

    EXPECT_FALSE(isInitialized());
}

TEST(LoggerTest, InitWritesToFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("sffc_log_" + std::to_string(std::random_device{}()) + ".log");

    Config config;
    config.logFile = path.string();
    config.enableConsole = false;
    config.level = Level::kDebug;
    init(config);
    ASSERT_TRUE(isInitialized());
    ASSERT_NE(logger(), nullptr);

    SFFC_LOG_INFO("Decoded {} reads", 3);
    flush();

    std::ifstream in(path);
    const std::string contents((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("Decoded 3 reads"), std::string::npos);

    shutdown();
    EXPECT_FALSE(isInitialized());
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace
}  // namespace sffc::log
