#pragma once

/**
 * @file log.hpp
 * @brief Lightweight, header-only logging utility used across keycast.
 *
 * Usage:
 *   @code{.cpp}
 *   #include <keycast/log.hpp>
 *   KEYCAST_LOG_DEBUG("pushed %s (width=%.1f)", label.c_str(), width);
 *   KEYCAST_LOG_INFO("ready");
 *   @endcode
 *
 * Runtime configuration is controlled by environment variables:
 *  - KEYCAST_LOG_LEVEL: one of "debug", "info", "warn", "error".
 *    Unset or unrecognized -> info.
 *  - KEYCAST_FORCE_COLORS: non-empty -> force ANSI colors on.
 *  - KEYCAST_NO_COLOR: non-empty -> disable ANSI colors.
 *
 * The frame loop logs per-event detail at Debug level only, so the default
 * Info level stays quiet while keys are being typed.
 */

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>
#include <unistd.h>

namespace keycast {
namespace log {

/**
 * @enum Level
 * @brief Logging severity levels used by the internal logging facility.
 *
 * Lower enum values are more verbose (Debug is the most verbose).
 */
enum class Level : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

inline const char *levelToString(Level l) {
  switch (l) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", their first
 * letters, or "0".."3").
 * @param name Level name, case-insensitive.
 * @param out Receives the parsed level on success.
 * @return true when @p name was recognized.
 */
inline bool parseLevel(const std::string &name, Level &out) {
  std::string s(name);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (s == "debug" || s == "d" || s == "0") {
    out = Level::Debug;
    return true;
  }
  if (s == "info" || s == "i" || s == "1") {
    out = Level::Info;
    return true;
  }
  if (s == "warn" || s == "warning" || s == "w" || s == "2") {
    out = Level::Warn;
    return true;
  }
  if (s == "error" || s == "e" || s == "3") {
    out = Level::Error;
    return true;
  }
  return false;
}

/**
 * @brief Parse runtime configuration to determine the default log level.
 *
 * Unset or unrecognized KEYCAST_LOG_LEVEL selects Info.
 * @return Level The determined default log level.
 */
inline Level parseLevelFromEnv() {
  Level lvl = Level::Info;
  const char *lvlEnv = std::getenv("KEYCAST_LOG_LEVEL");
  if (lvlEnv && lvlEnv[0] != '\0' && parseLevel(lvlEnv, lvl))
    return lvl;
  return Level::Info;
}

/**
 * @brief Accessor for the global log level used by the library.
 *
 * The log level is stored in an atomic so it can be changed safely at runtime.
 * @return std::atomic<Level>& Reference to the global atomic log level.
 */
inline std::atomic<Level> &globalLevel() {
  static std::atomic<Level> lvl(parseLevelFromEnv());
  return lvl;
}

inline void setLevel(Level l) { globalLevel().store(l); }
inline Level getLevel() { return globalLevel().load(); }

/**
 * @brief Determine whether a message at `level` should be emitted under the
 * current global level.
 * @param level Candidate message level to test.
 * @return true if the message should be emitted.
 */
inline bool isEnabled(Level level) {
  return static_cast<int>(level) >= static_cast<int>(getLevel());
}

/**
 * @internal
 * @brief Internal mutex used to serialize access to stderr.
 * @return std::mutex& Reference to the mutex used for output serialization.
 */
inline std::mutex &outputMutex() {
  static std::mutex m;
  return m;
}

/**
 * @internal
 * @brief Return an ANSI color escape sequence for the given log level.
 * @param l Log level.
 * @return const char* Null-terminated ANSI escape sequence (or reset code).
 */
inline const char *levelColor(Level l) {
  switch (l) {
  case Level::Debug:
    return "\x1b[33m"; // Yellow
  case Level::Info:
    return "\x1b[34m"; // Blue
  case Level::Warn:
    return "\x1b[38;5;208m"; // Orange (256-color)
  case Level::Error:
    return "\x1b[31m"; // Red
  default:
    return "\x1b[0m";
  }
}

/**
 * @internal
 * @brief Determine whether ANSI colors should be emitted.
 *
 * Colors can be forced via KEYCAST_FORCE_COLORS or disabled with
 * KEYCAST_NO_COLOR. Otherwise colors are enabled when stderr is a TTY.
 * @return true if colors are enabled, false otherwise.
 */
inline bool colorsEnabled() {
  const char *force = std::getenv("KEYCAST_FORCE_COLORS");
  if (force && force[0] != '\0')
    return true;
  const char *no = std::getenv("KEYCAST_NO_COLOR");
  if (no && no[0] != '\0')
    return false;
  return isatty(fileno(stderr));
}

/**
 * @internal
 * @brief Trim a file path so it starts at the last "src" or "include"
 * component of the keycast tree.
 *
 * If neither component is present this function returns the basename (the
 * portion after the last slash).
 * @param path Null-terminated file path.
 * @return const char* Pointer into `path` that points to the trimmed start.
 */
inline const char *trimSourcePath(const char *path) {
  if (!path)
    return path;
  const char *last = nullptr;
  for (const char *needle : {"/src/", "/include/", "/tests/"}) {
    const char *p = path;
    while (const char *found = std::strstr(p, needle)) {
      if (!last || found > last)
        last = found;
      p = found + 1;
    }
  }
  if (last)
    return last + 1;
  const char *last_slash = std::strrchr(path, '/');
  return last_slash ? last_slash + 1 : path;
}

/**
 * @internal
 * @brief Emit a formatted log message using a va_list (thread-safe).
 *
 * Produces a timestamp (local time, millisecond precision), level name,
 * and source file/line prefix before the formatted message body.
 *
 * @param level Log level for the message.
 * @param file Source file name (typically `__FILE__`).
 * @param line Source line number (typically `__LINE__`).
 * @param fmt printf-style format string.
 * @param ap Preinitialized va_list of arguments for `fmt`.
 */
inline void vlog(Level level, const char *file, int line, const char *fmt,
                 va_list ap) {
  if (!isEnabled(level))
    return;

  // Grab time
  using namespace std::chrono;
  auto now = system_clock::now();
  auto ms =
      duration_cast<milliseconds>(now.time_since_epoch()) % milliseconds(1000);
  std::time_t t = system_clock::to_time_t(now);

  // Convert to local time in a portable way
  std::tm tmbuf;
  localtime_r(&t, &tmbuf);

  char timebuf[64];
  if (std::strftime(timebuf, sizeof(timebuf), "%Y-%m-%d %H:%M:%S", &tmbuf) ==
      0) {
    // Fallback if strftime fails
    std::snprintf(timebuf, sizeof(timebuf), "%lld", static_cast<long long>(t));
  }

  // Serialise output to avoid interleaving
  std::lock_guard<std::mutex> lk(outputMutex());

  const bool use_colors = colorsEnabled();
  const char *reset = use_colors ? "\x1b[0m" : "";
  const char *file_color = use_colors ? "\x1b[90m" : "";
  const char *lvl_color = use_colors ? levelColor(level) : "";

  const char *trimmed = trimSourcePath(file);

  // Header: timestamp.millis [LEVEL] file:line: (with coloring)
  std::fprintf(stderr, "[keycast] %s.%03d [", timebuf,
               static_cast<int>(ms.count()));
  if (use_colors)
    std::fputs(lvl_color, stderr);
  std::fprintf(stderr, "%s", levelToString(level));
  if (use_colors)
    std::fputs(reset, stderr);
  std::fprintf(stderr, "] ");
  if (use_colors)
    std::fputs(file_color, stderr);
  std::fprintf(stderr, "%s:%d: ", trimmed, line);
  if (use_colors)
    std::fputs(reset, stderr);

  // Body
  std::vfprintf(stderr, fmt, ap);

  // Newline and flush for immediacy
  std::fprintf(stderr, "\n");
  std::fflush(stderr);
}

/**
 * @brief Log a message with varargs.
 *
 * Convenience wrapper around `vlog` that accepts printf-style variadic
 * arguments. Automatically checks the log level before formatting.
 *
 * @param level Log level for the message.
 * @param file Source file name (typically `__FILE__`).
 * @param line Source line number (typically `__LINE__`).
 * @param fmt printf-style format string.
 */
inline void log(Level level, const char *file, int line, const char *fmt, ...) {
  if (!isEnabled(level))
    return;
  va_list ap;
  va_start(ap, fmt);
  vlog(level, file, line, fmt, ap);
  va_end(ap);
}

/**
 * @brief Convenience helper that returns whether debug logging is enabled.
 * @return true if Debug messages will be emitted.
 */
inline bool debugEnabled() { return isEnabled(Level::Debug); }

} // namespace log
} // namespace keycast

/**
 * @defgroup LoggingMacros Helper logging macros
 * @brief Convenience macros that include file and line automatically.
 *
 * These macros wrap `::keycast::log::log` and automatically supply
 * `__FILE__` and `__LINE__`.
 * @{
 */
#define KEYCAST_LOG_DEBUG(fmt, ...)                                            \
  ::keycast::log::log(::keycast::log::Level::Debug, __FILE__, __LINE__, fmt,   \
                      ##__VA_ARGS__)
#define KEYCAST_LOG_INFO(fmt, ...)                                             \
  ::keycast::log::log(::keycast::log::Level::Info, __FILE__, __LINE__, fmt,    \
                      ##__VA_ARGS__)
#define KEYCAST_LOG_WARN(fmt, ...)                                             \
  ::keycast::log::log(::keycast::log::Level::Warn, __FILE__, __LINE__, fmt,    \
                      ##__VA_ARGS__)
#define KEYCAST_LOG_ERROR(fmt, ...)                                            \
  ::keycast::log::log(::keycast::log::Level::Error, __FILE__, __LINE__, fmt,   \
                      ##__VA_ARGS__)
/** @} */ /* end of LoggingMacros */
