#include "entropix/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace entropix {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?";
}

}  // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void log_message(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) > g_level.load(std::memory_order_relaxed))
        return;

    // Format into one buffer so concurrent writers don't interleave lines.
    char buf[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    std::fprintf(stderr, "[entropix] %s %s\n", level_name(level), buf);
}

}  // namespace entropix
