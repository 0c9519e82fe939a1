#pragma once
#include <chrono>
#include <functional>
#include <string>

using SteadyClock = std::chrono::steady_clock;
using SteadyClockFn = std::function<SteadyClock::time_point()>;

std::string getenv_or(const char* key, const std::string& def);

// 128-bit random id rendered as 32 hex characters.
std::string generate_id();

// ISO-8601 UTC with millisecond precision, e.g. 2025-01-31T12:00:00.123Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

SteadyClockFn steady_clock_fn();

inline double to_seconds(SteadyClock::duration d) {
    return std::chrono::duration<double>(d).count();
}
