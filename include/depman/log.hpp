#pragma once

#include <depman/result.hpp>
#include <string>

// printf-style leveled logging to stderr. stdout is left to reports.
namespace depman::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

#if defined(__GNUC__)
#define DEPMAN_PRINTF(fmt_idx, arg_idx) __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define DEPMAN_PRINTF(fmt_idx, arg_idx)
#endif

void trace(const char* fmt, ...) DEPMAN_PRINTF(1, 2);
void debug(const char* fmt, ...) DEPMAN_PRINTF(1, 2);
void info(const char* fmt, ...) DEPMAN_PRINTF(1, 2);
void warn(const char* fmt, ...) DEPMAN_PRINTF(1, 2);
void error(const char* fmt, ...) DEPMAN_PRINTF(1, 2);

const char* level_name(Level lvl);

// "trace" | "debug" | "info" | "warn" | "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

} // namespace depman::log
