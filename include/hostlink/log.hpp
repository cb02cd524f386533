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
 * @brief Leveled, printf-style logging to stderr.
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [INFO] [Link] message (file.hpp:42)
 *
 * The (file:line) suffix is omitted in NDEBUG builds. Levels below
 * HOSTLINK_LOG_MIN_LEVEL compile to nothing; the runtime level filters the
 * rest. A custom sink may replace stderr output.
 */

#ifndef HOSTLINK_LOG_HPP_
#define HOSTLINK_LOG_HPP_

#include "hostlink/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>

#ifndef HOSTLINK_LOG_MIN_LEVEL
#define HOSTLINK_LOG_MIN_LEVEL 0
#endif

namespace hostlink {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Receives one fully formatted message.
 *
 * Called with the internal log mutex held; must not log recursively.
 */
using SinkFn = void (*)(Level level, const char* category, const char* message,
                        void* ctx);

static constexpr uint32_t kMaxMessageLen = 512;

namespace detail {

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff:   return "OFF";
  }
  return "?";
}

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

struct SinkSlot {
  std::mutex mutex;
  SinkFn fn = nullptr;
  void* ctx = nullptr;
};

inline SinkSlot& Sink() noexcept {
  static SinkSlot slot;
  return slot;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  struct timespec ts;
  (void)clock_gettime(CLOCK_REALTIME, &ts);
  time_t t = ts.tv_sec;
  struct tm tm_local;
  if (localtime_r(&t, &tm_local) == nullptr) {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
    return;
  }
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec,
                      static_cast<unsigned>(ts.tv_nsec / 1000000));
}

}  // namespace detail

// ============================================================================
// Level / Lifecycle
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LogLevelRef().load(std::memory_order_relaxed));
}

inline bool IsEnabled(Level level) noexcept {
  return static_cast<uint8_t>(level) >=
             detail::LogLevelRef().load(std::memory_order_relaxed) &&
         level != Level::kOff;
}

/** @brief Mark logging initialized. Logging also works without Init(). */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush stderr and restore the default sink. */
inline void Shutdown() noexcept {
  {
    std::lock_guard<std::mutex> lock(detail::Sink().mutex);
    detail::Sink().fn = nullptr;
    detail::Sink().ctx = nullptr;
  }
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/** @brief Route messages to @p fn instead of stderr. nullptr restores stderr. */
inline void SetSink(SinkFn fn, void* ctx) noexcept {
  std::lock_guard<std::mutex> lock(detail::Sink().mutex);
  detail::Sink().fn = fn;
  detail::Sink().ctx = ctx;
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (!IsEnabled(level)) {
    return;
  }

  char msg[kMaxMessageLen];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  std::lock_guard<std::mutex> lock(detail::Sink().mutex);
  if (detail::Sink().fn != nullptr) {
    detail::Sink().fn(level, category, msg, detail::Sink().ctx);
    return;
  }

  char ts_buf[64];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg, file, line);
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
}  // namespace hostlink

// ============================================================================
// Macros
// ============================================================================

#define HOSTLINK_LOG_DEBUG(cat, fmt, ...)                                 \
  do {                                                                    \
    if (HOSTLINK_LOG_MIN_LEVEL <= 0) {                                    \
      ::hostlink::log::LogWrite(::hostlink::log::Level::kDebug, cat,      \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);  \
    }                                                                     \
  } while (0)

#define HOSTLINK_LOG_INFO(cat, fmt, ...)                                  \
  do {                                                                    \
    if (HOSTLINK_LOG_MIN_LEVEL <= 1) {                                    \
      ::hostlink::log::LogWrite(::hostlink::log::Level::kInfo, cat,       \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);  \
    }                                                                     \
  } while (0)

#define HOSTLINK_LOG_WARN(cat, fmt, ...)                                  \
  do {                                                                    \
    if (HOSTLINK_LOG_MIN_LEVEL <= 2) {                                    \
      ::hostlink::log::LogWrite(::hostlink::log::Level::kWarn, cat,       \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);  \
    }                                                                     \
  } while (0)

#define HOSTLINK_LOG_ERROR(cat, fmt, ...)                                 \
  do {                                                                    \
    if (HOSTLINK_LOG_MIN_LEVEL <= 3) {                                    \
      ::hostlink::log::LogWrite(::hostlink::log::Level::kError, cat,      \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);  \
    }                                                                     \
  } while (0)

#define HOSTLINK_LOG_FATAL(cat, fmt, ...)                                 \
  do {                                                                    \
    ::hostlink::log::LogWrite(::hostlink::log::Level::kFatal, cat,        \
                              __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
  } while (0)

#endif  // HOSTLINK_LOG_HPP_
