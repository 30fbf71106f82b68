#pragma once

namespace objstore {

// Messages below the threshold are dropped. Defaults to Info, or Debug when
// OBJSTORE_DEBUG is set in the environment.
enum class LogLevel { Debug, Info, Warn, Error };

void set_log_level(LogLevel level);
LogLevel log_level();

void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace objstore
