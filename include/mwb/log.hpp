/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file log.hpp
 * @brief Leveled, category-tagged printf-style logging to stderr.
 *
 * Two filters apply to every call:
 *   - compile time: MWB_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL) removes the call
 *   - run time:     SetLevel() drops entries below the current level
 *
 * Lines are serialized through one mutex so entries from the ingest thread,
 * the sweep thread and session handlers never interleave.
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [INFO] [Registry] Discovered device: kitchen
 * Debug builds append "(file.hpp:42)".
 */

#ifndef MWB_LOG_HPP_
#define MWB_LOG_HPP_

#include "mwb/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(MWB_PLATFORM_LINUX) || defined(MWB_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef MWB_LOG_MIN_LEVEL
#define MWB_LOG_MIN_LEVEL 0
#endif

namespace mwb {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff,
};

namespace detail {

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?";
  }
}

struct LogState {
#ifdef NDEBUG
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  std::atomic<bool> initialized{false};
  std::mutex write_mutex;
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(MWB_PLATFORM_LINUX) || defined(MWB_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local == nullptr) {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
    return;
  }
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                      tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                      tm_local->tm_mday, tm_local->tm_hour, tm_local->tm_min,
                      tm_local->tm_sec);
#endif
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::State().level.load(std::memory_order_relaxed));
}

inline void Init() noexcept {
  detail::State().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::State().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal",
 *        "off"), case-insensitive.
 * @return true and writes @p out on success.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static const struct {
    const char* name;
    Level level;
  } kTable[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  char lowered[16];
  size_t i = 0;
  for (; name[i] != '\0' && i + 1 < sizeof(lowered); ++i) {
    char c = name[i];
    lowered[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  if (name[i] != '\0') return false;
  lowered[i] = '\0';
  for (const auto& entry : kTable) {
    if (std::strcmp(lowered, entry.name) == 0) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  std::lock_guard<std::mutex> lock(detail::State().write_mutex);
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level),
                     category != nullptr ? category : "-", message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level),
                     category != nullptr ? category : "-", message,
                     detail::Basename(file), line);
#endif
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace mwb

// ============================================================================
// Macros
// ============================================================================

#define MWB_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                 \
    if (MWB_LOG_MIN_LEVEL <= 0) {                                      \
      ::mwb::log::LogWrite(::mwb::log::Level::kDebug, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

#define MWB_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                 \
    if (MWB_LOG_MIN_LEVEL <= 1) {                                      \
      ::mwb::log::LogWrite(::mwb::log::Level::kInfo, cat, __FILE__,    \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

#define MWB_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                 \
    if (MWB_LOG_MIN_LEVEL <= 2) {                                      \
      ::mwb::log::LogWrite(::mwb::log::Level::kWarn, cat, __FILE__,    \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

#define MWB_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                 \
    if (MWB_LOG_MIN_LEVEL <= 3) {                                      \
      ::mwb::log::LogWrite(::mwb::log::Level::kError, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

#define MWB_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                 \
    ::mwb::log::LogWrite(::mwb::log::Level::kFatal, cat, __FILE__,     \
                         __LINE__, fmt, ##__VA_ARGS__);                \
    std::abort();                                                      \
  } while (0)

#endif  // MWB_LOG_HPP_
