#pragma once
// Log.hpp – Minimal leveled logging for load-time and request diagnostics.
// Warn and Error go to stderr, everything else to stdout.

#include <string>

namespace tba3 {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Global verbosity (default Info).
void setLogLevel(LogLevel lvl) noexcept;
[[nodiscard]] LogLevel logLevel() noexcept;

// Parses "debug", "info", "warn" or "error" (case-insensitive).
// Returns false and leaves out untouched for anything else.
bool parseLogLevel(const std::string& text, LogLevel& out);

void log(LogLevel lvl, const std::string& msg);

inline void logDebug(const std::string& msg) { log(LogLevel::Debug, msg); }
inline void logInfo (const std::string& msg) { log(LogLevel::Info,  msg); }
inline void logWarn (const std::string& msg) { log(LogLevel::Warn,  msg); }
inline void logError(const std::string& msg) { log(LogLevel::Error, msg); }

} // namespace tba3
