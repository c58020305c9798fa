#include "log.hpp"
#include <atomic>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> g_min_level{ static_cast<int>(LogLevel::Info) };
std::mutex g_write_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

void log_set_level(LogLevel level) {
    g_min_level.store(static_cast<int>(level));
}

LogLevel log_get_level() {
    return static_cast<LogLevel>(g_min_level.load());
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string up = text;
    std::transform(up.begin(), up.end(), up.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG") { out = LogLevel::Debug; return true; }
    if (up == "INFO")  { out = LogLevel::Info;  return true; }
    if (up == "WARN")  { out = LogLevel::Warn;  return true; }
    if (up == "ERROR") { out = LogLevel::Error; return true; }
    return false;
}

void log_message(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < g_min_level.load()) return;
    std::string line = utc_timestamp() + " [" + level_name(level) + "] " + msg + "\n";
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line;
}
