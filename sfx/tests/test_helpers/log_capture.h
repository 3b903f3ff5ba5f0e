// ==============================================================================
// Log Capture
// ==============================================================================
// Scoped redirection of the library log sink into memory so tests can assert
// on warnings and errors. Not thread-safe; tests run serially.
// ==============================================================================

#pragma once

#include <bleep/sfx/core/logging.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace TestHelpers {

struct CapturedLog {
    Bleep::Sfx::LogLevel level;
    std::string message;
};

class LogCapture {
public:
    LogCapture() {
        entries().clear();
        Bleep::Sfx::setLogSink(&LogCapture::sink);
    }

    ~LogCapture() {
        Bleep::Sfx::setLogSink(nullptr);
        entries().clear();
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] const std::vector<CapturedLog>& logs() const { return entries(); }

    [[nodiscard]] size_t count(Bleep::Sfx::LogLevel level) const {
        return static_cast<size_t>(std::count_if(entries().begin(), entries().end(),
            [level](const CapturedLog& e) { return e.level == level; }));
    }

    [[nodiscard]] bool contains(std::string_view text) const {
        return std::any_of(entries().begin(), entries().end(),
            [text](const CapturedLog& e) { return e.message.find(text) != std::string::npos; });
    }

private:
    static std::vector<CapturedLog>& entries() {
        static std::vector<CapturedLog> captured;
        return captured;
    }

    static void sink(Bleep::Sfx::LogLevel level, const char* message) {
        entries().push_back({level, message});
    }
};

} // namespace TestHelpers
