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
 * @brief Synchronous printf-style category logging to stderr.
 *
 * Each line has the form
 *   [2026-10-19 12:00:00.123] [INFO ] [Driver] message (driver.hpp:42)
 * and is written under a process-wide mutex so lines from the event-loop
 * thread and the transport threads never interleave.
 *
 * Filtering happens twice: DGT_LOG_MIN_LEVEL removes calls at compile time,
 * log::SetLevel() filters at run time.
 */

#ifndef DGT_LOG_HPP_
#define DGT_LOG_HPP_

#include "dgt/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>

#include <time.h>

#ifndef DGT_LOG_MIN_LEVEL
#define DGT_LOG_MIN_LEVEL 0
#endif

namespace dgt {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<uint8_t>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO ";
    case Level::kWarn:
      return "WARN ";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?????";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_buf;
  ::localtime_r(&ts.tv_sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  if (n > 0 && n < size) {
    (void)std::snprintf(buf + n, size - n, ".%03ld", ts.tv_nsec / 1000000L);
  }
}

}  // namespace detail

// ============================================================================
// Runtime Configuration
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LogLevelRef().load(std::memory_order_relaxed));
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal",
 *        "off"), case-insensitive.
 * @return true and sets @p out on success.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  char lower[16];
  size_t i = 0;
  for (; name[i] != '\0' && i < sizeof(lower) - 1U; ++i) {
    char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  lower[i] = '\0';

  static const struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& entry : kNames) {
    if (std::strcmp(lower, entry.name) == 0) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
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

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, message,
                     detail::Basename(file), line);
#endif
  if (level >= Level::kError) {
    (void)std::fflush(stderr);
  }
}

DGT_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace dgt

// ============================================================================
// Macros
// ============================================================================

#define DGT_LOG_DEBUG(cat, fmt, ...)                                  \
  do {                                                                \
    if (DGT_LOG_MIN_LEVEL <= 0) {                                     \
      ::dgt::log::LogWrite(::dgt::log::Level::kDebug, cat, __FILE__,  \
                           __LINE__, fmt, ##__VA_ARGS__);             \
    }                                                                 \
  } while (0)

#define DGT_LOG_INFO(cat, fmt, ...)                                   \
  do {                                                                \
    if (DGT_LOG_MIN_LEVEL <= 1) {                                     \
      ::dgt::log::LogWrite(::dgt::log::Level::kInfo, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__);             \
    }                                                                 \
  } while (0)

#define DGT_LOG_WARN(cat, fmt, ...)                                   \
  do {                                                                \
    if (DGT_LOG_MIN_LEVEL <= 2) {                                     \
      ::dgt::log::LogWrite(::dgt::log::Level::kWarn, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__);             \
    }                                                                 \
  } while (0)

#define DGT_LOG_ERROR(cat, fmt, ...)                                  \
  do {                                                                \
    ::dgt::log::LogWrite(::dgt::log::Level::kError, cat, __FILE__,    \
                         __LINE__, fmt, ##__VA_ARGS__);               \
  } while (0)

#define DGT_LOG_FATAL(cat, fmt, ...)                                  \
  do {                                                                \
    ::dgt::log::LogWrite(::dgt::log::Level::kFatal, cat, __FILE__,    \
                         __LINE__, fmt, ##__VA_ARGS__);               \
    std::abort();                                                     \
  } while (0)

#endif  // DGT_LOG_HPP_
