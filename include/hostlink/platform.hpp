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
 * @file platform.hpp
 * @brief Platform detection, compiler hints, clock helpers and assertions.
 */

#ifndef HOSTLINK_PLATFORM_HPP_
#define HOSTLINK_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace hostlink {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define HOSTLINK_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define HOSTLINK_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define HOSTLINK_PLATFORM_WINDOWS 1
#endif

/// POSIX sockets are available (Linux and macOS).
#if defined(HOSTLINK_PLATFORM_LINUX) || defined(HOSTLINK_PLATFORM_MACOS)
#define HOSTLINK_HAS_NETWORK 1
#else
#define HOSTLINK_HAS_NETWORK 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define HOSTLINK_LIKELY(x) __builtin_expect(!!(x), 1)
#define HOSTLINK_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define HOSTLINK_UNUSED __attribute__((unused))
#else
#define HOSTLINK_LIKELY(x) (x)
#define HOSTLINK_UNLIKELY(x) (x)
#define HOSTLINK_UNUSED
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "HOSTLINK_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define HOSTLINK_ASSERT(cond) ((void)0)
#else
#define HOSTLINK_ASSERT(cond)                                             \
  ((cond) ? ((void)0)                                                     \
          : ::hostlink::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Monotonic Clock
// ============================================================================

/** @brief Monotonic time in nanoseconds. */
inline uint64_t SteadyNowNs() noexcept {
  const auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count());
}

/** @brief Monotonic time in milliseconds. */
inline uint64_t SteadyNowMs() noexcept {
  return SteadyNowNs() / 1000000ULL;
}

}  // namespace hostlink

#endif  // HOSTLINK_PLATFORM_HPP_
