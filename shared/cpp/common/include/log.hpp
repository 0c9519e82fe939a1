#pragma once
#include <functional>
#include <string>

enum class LogLevel { error = 0, warn = 1, info = 2, debug = 3 };

using LogSink = std::function<void(LogLevel level, const std::string& tag, const std::string& message)>;

void log_set_level(LogLevel level);
LogLevel log_level();
LogLevel log_level_from_string(const std::string& s, LogLevel fallback = LogLevel::info);
const char* log_level_name(LogLevel level);

// Replaces the console sink; an empty sink restores it. Returns the previous sink.
LogSink log_set_sink(LogSink sink);

void log_write(LogLevel level, const std::string& tag, const std::string& message);

inline void log_error(const std::string& tag, const std::string& msg) { log_write(LogLevel::error, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg) { log_write(LogLevel::warn, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg) { log_write(LogLevel::info, tag, msg); }
inline void log_debug(const std::string& tag, const std::string& msg) { log_write(LogLevel::debug, tag, msg); }
