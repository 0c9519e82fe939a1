#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_log_mtx;
bool g_level_set = false;
LogLevel g_level = LogLevel::info;
LogSink g_sink;

LogLevel current_level_locked() {
    if (!g_level_set) {
        g_level = log_level_from_string(getenv_or("COMPRESSOR_LOG_LEVEL", "info"));
        g_level_set = true;
    }
    return g_level;
}
}

void log_set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    g_level = level;
    g_level_set = true;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    return current_level_locked();
}

LogLevel log_level_from_string(const std::string& s, LogLevel fallback) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "error") return LogLevel::error;
    if (v == "warn" || v == "warning") return LogLevel::warn;
    if (v == "info") return LogLevel::info;
    if (v == "debug" || v == "trace") return LogLevel::debug;
    return fallback;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::error: return "ERROR";
        case LogLevel::warn: return "WARN";
        case LogLevel::info: return "INFO";
        case LogLevel::debug: return "DEBUG";
    }
    return "INFO";
}

LogSink log_set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    LogSink prev = std::move(g_sink);
    g_sink = std::move(sink);
    return prev;
}

void log_write(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (static_cast<int>(level) > static_cast<int>(current_level_locked())) return;
    if (g_sink) {
        g_sink(level, tag, message);
        return;
    }
    // stdout for progress chatter, stderr for anything that needs attention
    if (level == LogLevel::error || level == LogLevel::warn) {
        std::cerr << "[" << tag << "] " << log_level_name(level) << ": " << message << std::endl;
    } else {
        std::cout << "[" << tag << "] " << message << std::endl;
    }
}
