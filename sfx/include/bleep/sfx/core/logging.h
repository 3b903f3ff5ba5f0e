// ==============================================================================
// Layer 0: Core Utility - Diagnostic Logging
// ==============================================================================
// printf-style diagnostics for the non-real-time parts of the library
// (context lifecycle, host failures). Messages are formatted into a fixed
// stack buffer and handed to a sink; the default sink writes to stderr.
//
// Never call from a render callback: formatting and I/O are not real-time safe.
// ==============================================================================

#pragma once

#include <cstdint>

// Debug-level messages are compiled out unless this is set to 1.
#ifndef BLEEP_SFX_DEBUG_LOGGING
#define BLEEP_SFX_DEBUG_LOGGING 0
#endif

#if defined(__GNUC__) || defined(__clang__)
#define BLEEP_SFX_PRINTF_FORMAT(fmtIndex, argIndex) __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define BLEEP_SFX_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace Bleep {
namespace Sfx {

/// @brief Severity of a diagnostic message.
enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warning,
    Error
};

/// @brief Receives every formatted message. Must not throw.
using LogSink = void (*)(LogLevel level, const char* message);

/// Maximum formatted message length including terminator; longer messages are truncated.
inline constexpr int kMaxLogMessageLength = 512;

/// @brief Install a sink. Passing nullptr restores the stderr sink.
void setLogSink(LogSink sink) noexcept;

/// @brief Format and dispatch a message to the active sink.
void logMessage(LogLevel level, const char* format, ...) noexcept BLEEP_SFX_PRINTF_FORMAT(2, 3);

/// @brief Short uppercase tag for a level ("DEBUG", "INFO", "WARN", "ERROR").
[[nodiscard]] const char* logLevelName(LogLevel level) noexcept;

} // namespace Sfx
} // namespace Bleep

#if BLEEP_SFX_DEBUG_LOGGING
#define BLEEP_SFX_LOG_DEBUG(...) ::Bleep::Sfx::logMessage(::Bleep::Sfx::LogLevel::Debug, __VA_ARGS__)
#else
#define BLEEP_SFX_LOG_DEBUG(...) ((void)0)
#endif
#define BLEEP_SFX_LOG_INFO(...) ::Bleep::Sfx::logMessage(::Bleep::Sfx::LogLevel::Info, __VA_ARGS__)
#define BLEEP_SFX_LOG_WARN(...) ::Bleep::Sfx::logMessage(::Bleep::Sfx::LogLevel::Warning, __VA_ARGS__)
#define BLEEP_SFX_LOG_ERROR(...) ::Bleep::Sfx::logMessage(::Bleep::Sfx::LogLevel::Error, __VA_ARGS__)
