// Log.cpp – Timestamped, level-tagged log lines behind a coarse mutex.

#include "TBA3Generator/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace tba3 {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex       g_log_mu;

static const char* levelTag(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void setLogLevel(LogLevel lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel logLevel() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "debug") { out = LogLevel::Debug; return true; }
    if (t == "info")  { out = LogLevel::Info;  return true; }
    if (t == "warn" || t == "warning") { out = LogLevel::Warn; return true; }
    if (t == "error") { out = LogLevel::Error; return true; }
    return false;
}

static std::string utcTimestamp() {
    using clock = std::chrono::system_clock;
    const std::time_t tt = clock::to_time_t(clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed))
        return;

    const std::string stamp = utcTimestamp();
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::ostream& out = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
    out << '[' << stamp << "][" << levelTag(lvl) << "] " << msg << '\n';
    out.flush();
}

} // namespace tba3
