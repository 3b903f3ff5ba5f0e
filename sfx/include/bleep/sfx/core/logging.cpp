// ==============================================================================
// Diagnostic Logging Implementation
// ==============================================================================

#include "logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace Bleep {
namespace Sfx {

namespace {

void stderrSink(LogLevel level, const char* message) {
    std::fprintf(stderr, "[bleep-sfx] %s: %s\n", logLevelName(level), message);
}

std::atomic<LogSink> gSink{&stderrSink};

} // namespace

void setLogSink(LogSink sink) noexcept {
    gSink.store(sink != nullptr ? sink : &stderrSink, std::memory_order_release);
}

void logMessage(LogLevel level, const char* format, ...) noexcept {
    if (format == nullptr) {
        return;
    }

    char buf[kMaxLogMessageLength];
    va_list args;
    va_start(args, format);
    const int written = std::vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);
    if (written < 0) {
        return;
    }

    gSink.load(std::memory_order_acquire)(level, buf);
}

const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "?";
}

} // namespace Sfx
} // namespace Bleep
