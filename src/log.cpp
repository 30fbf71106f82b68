#include "objstore/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace objstore {

namespace {

LogLevel initial_level() {
    const char* env = std::getenv("OBJSTORE_DEBUG");
    return (env && *env && *env != '0') ? LogLevel::Debug : LogLevel::Info;
}

std::atomic<LogLevel>& level_ref() {
    static std::atomic<LogLevel> level{initial_level()};
    return level;
}

bool enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(level_ref().load(std::memory_order_relaxed));
}

} // namespace

void set_log_level(LogLevel level) {
    level_ref().store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return level_ref().load(std::memory_order_relaxed);
}

void log_debug(const char* fmt, ...) {
    if (!enabled(LogLevel::Debug)) return;
    va_list args;
    va_start(args, fmt);
    fprintf(stdout, "DEBUG: ");
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_info(const char* fmt, ...) {
    if (!enabled(LogLevel::Info)) return;
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_warn(const char* fmt, ...) {
    if (!enabled(LogLevel::Warn)) return;
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "WARNING: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

} // namespace objstore
