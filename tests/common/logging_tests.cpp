#include <gtest/gtest.h>
#include "actiondag/common/logging.hpp"

using namespace actiondag;

// =============================================================================
// Engine logger
// =============================================================================

class LoggingTests : public ::testing::Test
{
protected:
    void TearDown() override
    {
        set_log_level(spdlog::level::info);
    }
};

TEST_F(LoggingTests, GetLogger_ReturnsNamedSingleton)
{
    auto first = get_logger();
    auto second = get_logger();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), kLoggerName);
}

TEST_F(LoggingTests, GetLogger_IsRegisteredWithSpdlog)
{
    auto logger = get_logger();
    EXPECT_EQ(spdlog::get(kLoggerName), logger);
}

TEST_F(LoggingTests, SetLogLevel_ChangesVerbosity)
{
    set_log_level(spdlog::level::warn);
    EXPECT_EQ(get_logger()->level(), spdlog::level::warn);
    EXPECT_FALSE(get_logger()->should_log(spdlog::level::info));
}
