// =============================================================================
// srtchunk - Logger Tests
// =============================================================================
// Unit tests for log level conversion and the pre-init macro behaviour.
// =============================================================================

#include "srtc/common/logger.h"

#include <gtest/gtest.h>

namespace srtc::log {
namespace {

TEST(LoggerTest, LevelFromStringIsCaseInsensitive) {
    EXPECT_EQ(levelFromString("trace"), Level::kTrace);
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("Warning"), Level::kWarning);
    EXPECT_EQ(levelFromString("error"), Level::kError);
    EXPECT_EQ(levelFromString("critical"), Level::kCritical);
}

TEST(LoggerTest, LevelAliases) {
    EXPECT_EQ(levelFromString("warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
}

TEST(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(levelFromString(""), Level::kInfo);
    EXPECT_EQ(levelFromString("verbose"), Level::kInfo);
}

TEST(LoggerTest, LevelToStringUsesCanonicalNames) {
    EXPECT_EQ(levelToString(Level::kWarning), "warning");
    EXPECT_EQ(levelToString(Level::kCritical), "critical");
    for (auto level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning, Level::kError,
                       Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

TEST(LoggerTest, MacrosAreNoOpsBeforeInit) {
    ASSERT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    SRTC_LOG_INFO("not delivered: {}", 42);
    SRTC_LOG_DEBUG("not delivered either");
    EXPECT_NO_THROW(flush());
}

TEST(LoggerTest, NoSinksLeavesMacrosSilent) {
    Config config;
    config.enableConsole = false;
    init(config);

    EXPECT_TRUE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    SRTC_LOG_WARNING("dropped: {}", "no sink");

    shutdown();
    EXPECT_FALSE(isInitialized());
}

}  // namespace
}  // namespace srtc::log
