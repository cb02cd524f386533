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
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all hostlink modules.
 *
 * - expected<V, E>  : value-or-error return type (no exceptions)
 * - optional<T>     : nullable value
 * - FixedFunction   : move-only callable with inline storage (no heap)
 * - FixedString<N>  : bounded, null-terminated string
 * - NewType<T, Tag> : strong typedef for IDs
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef HOSTLINK_VOCABULARY_HPP_
#define HOSTLINK_VOCABULARY_HPP_

#include "hostlink/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace hostlink {

// ============================================================================
// Shared Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

enum class TimerError : uint8_t {
  kSlotsFull = 0,
  kInvalidPeriod,
  kNotRunning,
  kAlreadyRunning,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success() / error() factories so that the
 * intent is explicit at every return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) { return expected(ValueTag{}, val); }
  static expected success(V&& val) {
    return expected(ValueTag{}, static_cast<V&&>(val));
  }
  static expected error(E err) noexcept { return expected(ErrorTag{}, err); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    HOSTLINK_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& noexcept {
    HOSTLINK_ASSERT(has_value_);
    return value_;
  }
  V&& value() && noexcept {
    HOSTLINK_ASSERT(has_value_);
    return static_cast<V&&>(value_);
  }

  E get_error() const noexcept {
    HOSTLINK_ASSERT(!has_value_);
    return error_;
  }

  template <typename U>
  V value_or(U&& default_val) const& {
    return has_value_ ? value_ : static_cast<V>(static_cast<U&&>(default_val));
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  expected(ValueTag, const V& val) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(val);
  }
  expected(ValueTag, V&& val) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(val));
  }
  expected(ErrorTag, E err) noexcept : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(err);
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/** @brief expected<void, E>: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    HOSTLINK_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E err) noexcept : error_(err), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(val);
  }
  optional(T&& val) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(static_cast<T&&>(val));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) T(other.value_);
    }
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) T(static_cast<T&&>(other.value_));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(other.value_);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(static_cast<T&&>(other.value_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & noexcept {
    HOSTLINK_ASSERT(has_value_);
    return value_;
  }
  const T& value() const& noexcept {
    HOSTLINK_ASSERT(has_value_);
    return value_;
  }
  T&& value() && noexcept {
    HOSTLINK_ASSERT(has_value_);
    return static_cast<T&&>(value_);
  }

  template <typename U>
  T value_or(U&& default_val) const& {
    return has_value_ ? value_ : static_cast<T>(static_cast<U&&>(default_val));
  }

  T* operator->() noexcept { return &value(); }
  const T* operator->() const noexcept { return &value(); }
  T& operator*() noexcept { return value(); }
  const T& operator*() const noexcept { return value(); }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

 private:
  union {
    T value_;
  };
  bool has_value_;
};

// ============================================================================
// FixedFunction<Signature, BufferSize>
// ============================================================================

/**
 * @brief Move-only type-erased callable stored inline.
 *
 * The callable must fit into BufferSize bytes; oversize captures fail at
 * compile time instead of falling back to the heap.
 */
template <typename Signature, size_t BufferSize = 4 * sizeof(void*)>
class FixedFunction;

template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;
  FixedFunction(std::nullptr_t) noexcept {}  // NOLINT(google-explicit-constructor)

  template <typename F,
            typename = typename std::enable_if<!std::is_same<
                typename std::decay<F>::type, FixedFunction>::value>::type>
  FixedFunction(F&& fn) noexcept {  // NOLINT(google-explicit-constructor)
    using Fn = typename std::decay<F>::type;
    static_assert(sizeof(Fn) <= BufferSize,
                  "callable too large for FixedFunction buffer");
    static_assert(alignof(Fn) <= alignof(std::max_align_t),
                  "callable over-aligned for FixedFunction buffer");
    ::new (static_cast<void*>(storage_)) Fn(static_cast<F&&>(fn));
    invoke_ = [](void* self, Args&&... args) -> Ret {
      return (*static_cast<Fn*>(self))(static_cast<Args&&>(args)...);
    };
    manage_ = [](Op op, void* dst, void* src) noexcept {
      Fn* from = static_cast<Fn*>(src);
      if (op == Op::kMove) {
        ::new (dst) Fn(static_cast<Fn&&>(*from));
      }
      from->~Fn();
    };
  }

  FixedFunction(FixedFunction&& other) noexcept { MoveFrom(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      Reset();
      MoveFrom(other);
    }
    return *this;
  }

  FixedFunction& operator=(std::nullptr_t) noexcept {
    Reset();
    return *this;
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() { Reset(); }

  Ret operator()(Args... args) {
    HOSTLINK_ASSERT(invoke_ != nullptr);
    return invoke_(static_cast<void*>(storage_), static_cast<Args&&>(args)...);
  }

  explicit operator bool() const noexcept { return invoke_ != nullptr; }

 private:
  enum class Op : uint8_t { kMove, kDestroy };
  using InvokeFn = Ret (*)(void*, Args&&...);
  using ManageFn = void (*)(Op, void*, void*);

  void MoveFrom(FixedFunction& other) noexcept {
    if (other.invoke_ != nullptr) {
      other.manage_(Op::kMove, static_cast<void*>(storage_),
                    static_cast<void*>(other.storage_));
      invoke_ = other.invoke_;
      manage_ = other.manage_;
      other.invoke_ = nullptr;
      other.manage_ = nullptr;
    }
  }

  void Reset() noexcept {
    if (invoke_ != nullptr) {
      manage_(Op::kDestroy, nullptr, static_cast<void*>(storage_));
      invoke_ = nullptr;
      manage_ = nullptr;
    }
  }

  alignas(std::max_align_t) unsigned char storage_[BufferSize];
  InvokeFn invoke_ = nullptr;
  ManageFn manage_ = nullptr;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Bounded string with inline storage. Always null-terminated.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept {  // NOLINT(google-explicit-constructor)
    static_assert(N - 1 <= Capacity, "string literal exceeds capacity");
    std::memcpy(buf_, str, N);
    size_ = N - 1;
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    assign(TruncateToCapacity, str, len);
  }

  FixedString& assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return *this;
    }
    return assign(TruncateToCapacity, str,
                  static_cast<uint32_t>(std::strlen(str)));
  }

  FixedString& assign(TruncateToCapacity_t, const char* str,
                      uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return *this;
    }
    size_ = (len > Capacity) ? Capacity : len;
    std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
    return *this;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }
  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

  template <uint32_t N>
  bool operator==(const FixedString<N>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }
  template <uint32_t N>
  bool operator!=(const FixedString<N>& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_ = 0;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

template <typename T, typename Tag>
class NewType final {
 public:
  constexpr explicit NewType(T val) noexcept : val_(val) {}
  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& rhs) const noexcept {
    return val_ == rhs.val_;
  }
  constexpr bool operator!=(const NewType& rhs) const noexcept {
    return val_ != rhs.val_;
  }
  constexpr bool operator<(const NewType& rhs) const noexcept {
    return val_ < rhs.val_;
  }

 private:
  T val_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

// ============================================================================
// Task
// ============================================================================

#ifndef HOSTLINK_TASK_BUFFER_SIZE
#define HOSTLINK_TASK_BUFFER_SIZE 128
#endif

/// Unit of work accepted by timers, worker pools and executors.
using Task = FixedFunction<void(), HOSTLINK_TASK_BUFFER_SIZE>;

}  // namespace hostlink

#endif  // HOSTLINK_VOCABULARY_HPP_
