// tests/logging_test.cpp
// Internal logger lifetime tests.

#include <gtest/gtest.h>
#include "logging.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

using namespace telemetrydeck;

namespace {

// Runs after static destructors of anything initialized later than its
// registration.
void log_during_exit() {
    TELEMETRYDECK_LOG_WARN("late log line", {logging::string_field("phase", "exit")});
}

} // namespace

TEST(LoggingTest, LoggerIsShared) {
    auto a = logging::logger();
    auto b = logging::logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), "telemetrydeck");
}

TEST(LoggingTest, SurvivesRegistryDrop) {
    auto before = logging::logger();
    spdlog::drop_all();
    EXPECT_EQ(logging::logger(), before);
    EXPECT_NO_THROW(TELEMETRYDECK_LOG_WARN("after drop"));
}

TEST(LoggingDeathTest, UsableDuringProcessExit) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        std::atexit(log_during_exit);
        TELEMETRYDECK_LOG_WARN("first log line");
        std::exit(0);
    }, ::testing::ExitedWithCode(0), "");
}
