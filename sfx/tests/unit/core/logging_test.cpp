// ==============================================================================
// Tests: Diagnostic Logging
// ==============================================================================

#include <bleep/sfx/core/logging.h>

#include <catch2/catch_test_macros.hpp>

#include <log_capture.h>

#include <cstring>
#include <string>

using namespace Bleep::Sfx;
using TestHelpers::LogCapture;

TEST_CASE("logMessage formats printf-style arguments", "[logging]") {
    LogCapture capture;

    logMessage(LogLevel::Info, "context %s at %d Hz", "created", 48000);

    REQUIRE(capture.logs().size() == 1);
    CHECK(capture.logs()[0].level == LogLevel::Info);
    CHECK(capture.logs()[0].message == "context created at 48000 Hz");
}

TEST_CASE("Logging macros route to the matching level", "[logging]") {
    LogCapture capture;

    BLEEP_SFX_LOG_INFO("info");
    BLEEP_SFX_LOG_WARN("warn %d", 1);
    BLEEP_SFX_LOG_ERROR("error");

    CHECK(capture.count(LogLevel::Info) == 1);
    CHECK(capture.count(LogLevel::Warning) == 1);
    CHECK(capture.count(LogLevel::Error) == 1);
    CHECK(capture.contains("warn 1"));
}

#if !BLEEP_SFX_DEBUG_LOGGING
TEST_CASE("Debug macro is compiled out by default", "[logging]") {
    LogCapture capture;
    BLEEP_SFX_LOG_DEBUG("invisible %d", 42);
    CHECK(capture.logs().empty());
}
#endif

TEST_CASE("Long messages are truncated, not overflowed", "[logging][edge]") {
    LogCapture capture;

    const std::string longText(2000, 'x');
    logMessage(LogLevel::Warning, "%s", longText.c_str());

    REQUIRE(capture.logs().size() == 1);
    CHECK(capture.logs()[0].message.size() == static_cast<size_t>(kMaxLogMessageLength - 1));
}

TEST_CASE("Null format string is ignored", "[logging][edge]") {
    LogCapture capture;
    logMessage(LogLevel::Error, nullptr);
    CHECK(capture.logs().empty());
}

TEST_CASE("logLevelName returns stable tags", "[logging]") {
    CHECK(std::strcmp(logLevelName(LogLevel::Debug), "DEBUG") == 0);
    CHECK(std::strcmp(logLevelName(LogLevel::Info), "INFO") == 0);
    CHECK(std::strcmp(logLevelName(LogLevel::Warning), "WARN") == 0);
    CHECK(std::strcmp(logLevelName(LogLevel::Error), "ERROR") == 0);
}
