#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

namespace fpssmb::log {

enum class Level { kTrace = 0, kDebug = 1, kInfo = 2, kWarn = 3, kError = 4, kNone = 5 };

inline const char *LevelName(Level level) {
  switch (level) {
    case Level::kTrace:
      return "TRACE";
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    default:
      return "NONE";
  }
}

inline bool StartsWithNoCase(const char *value, const char *prefix) {
  for (; *prefix != '\0'; ++value, ++prefix) {
    if (*value == '\0') {
      return false;
    }
    char c = *value;
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c + ('a' - 'A'));
    }
    if (c != *prefix) {
      return false;
    }
  }
  return true;
}

/** Accepts a level name (case-insensitive) or its number; anything else is INFO. */
inline Level ParseLevel(const char *text) {
  if (text == nullptr || *text == '\0') {
    return Level::kInfo;
  }
  if (StartsWithNoCase(text, "trace") || std::strcmp(text, "0") == 0) {
    return Level::kTrace;
  }
  if (StartsWithNoCase(text, "debug") || std::strcmp(text, "1") == 0) {
    return Level::kDebug;
  }
  if (StartsWithNoCase(text, "info") || std::strcmp(text, "2") == 0) {
    return Level::kInfo;
  }
  if (StartsWithNoCase(text, "warn") || std::strcmp(text, "3") == 0) {
    return Level::kWarn;
  }
  if (StartsWithNoCase(text, "error") || std::strcmp(text, "4") == 0) {
    return Level::kError;
  }
  if (StartsWithNoCase(text, "none") || std::strcmp(text, "5") == 0) {
    return Level::kNone;
  }
  return Level::kInfo;
}

inline bool ParseBool(const char *text, bool default_value = false) {
  if (text == nullptr || *text == '\0') {
    return default_value;
  }
  if (std::strcmp(text, "1") == 0 || StartsWithNoCase(text, "true")) {
    return true;
  }
  if (std::strcmp(text, "0") == 0 || StartsWithNoCase(text, "false")) {
    return false;
  }
  return default_value;
}

// Threshold and timestamp flag are read from the environment once.
inline Level CurrentLevel() {
  static std::atomic<int> cached{-1};
  int value = cached.load(std::memory_order_acquire);
  if (value >= 0) {
    return static_cast<Level>(value);
  }
  Level level = ParseLevel(std::getenv("FPSSMB_LOG_LEVEL"));
  cached.store(static_cast<int>(level), std::memory_order_release);
  return level;
}

inline bool WithTimestamp() {
  static std::atomic<int> cached{-1};
  int value = cached.load(std::memory_order_acquire);
  if (value >= 0) {
    return value != 0;
  }
  bool on = ParseBool(std::getenv("FPSSMB_LOG_TS"));
  cached.store(on ? 1 : 0, std::memory_order_release);
  return on;
}

inline void Logv(Level level, const char *file, int line, const char *fmt, va_list args) {
  if (level < CurrentLevel() || level == Level::kNone) {
    return;
  }
  char message[1024];
  std::vsnprintf(message, sizeof(message), fmt, args);

  if (WithTimestamp()) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%04d-%02d-%02d %02d:%02d:%02d", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    std::fprintf(stderr, "[%s] %-5s %s:%d: %s\n", stamp, LevelName(level), file, line, message);
  } else {
    std::fprintf(stderr, "%-5s %s:%d: %s\n", LevelName(level), file, line, message);
  }
}

#if defined(__GNUC__)
__attribute__((format(printf, 4, 5)))
#endif
inline void Logf(Level level, const char *file, int line, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  Logv(level, file, line, fmt, args);
  va_end(args);
}

}  // namespace fpssmb::log

#define FPSSMB_LOG_TRACE(...) ::fpssmb::log::Logf(::fpssmb::log::Level::kTrace, __FILE__, __LINE__, __VA_ARGS__)
#define FPSSMB_LOG_DEBUG(...) ::fpssmb::log::Logf(::fpssmb::log::Level::kDebug, __FILE__, __LINE__, __VA_ARGS__)
#define FPSSMB_LOG_INFO(...) ::fpssmb::log::Logf(::fpssmb::log::Level::kInfo, __FILE__, __LINE__, __VA_ARGS__)
#define FPSSMB_LOG_WARN(...) ::fpssmb::log::Logf(::fpssmb::log::Level::kWarn, __FILE__, __LINE__, __VA_ARGS__)
#define FPSSMB_LOG_ERROR(...) ::fpssmb::log::Logf(::fpssmb::log::Level::kError, __FILE__, __LINE__, __VA_ARGS__)
