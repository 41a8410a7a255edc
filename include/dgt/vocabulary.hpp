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
 * @brief Error enums, expected<V, E> and ScopeGuard shared by all modules.
 *
 * Library paths never throw: every fallible operation returns an
 * expected<V, E> carrying either the value or an error enum.
 */

#ifndef DGT_VOCABULARY_HPP_
#define DGT_VOCABULARY_HPP_

#include "dgt/platform.hpp"

#include <cstdint>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace dgt {

// ============================================================================
// Error Enums
// ============================================================================

enum class DgtError : uint8_t {
  kUnavailable = 0,   ///< No matching port, or the port cannot be opened.
  kMalformed,         ///< Codec lost sync with the byte stream.
  kIoLost,            ///< Physical disconnect or I/O failure.
  kTimeout,           ///< Caller deadline elapsed before the reply.
  kConnectionLost,    ///< Session died while the request was in flight.
  kClosed,            ///< Driver was closed explicitly.
  kDuplicateRequest,  ///< Correlation key already has a pending request.
  kSessionDead,       ///< Send attempted on a dead session.
  kCancelled,         ///< Caller cancelled the wait.
  kBadReply,          ///< Reply payload could not be decoded.
  kInvalidArgument,
  kWouldDeadlock,     ///< Blocking call issued from the event-loop thread.
};

inline const char* DgtErrorName(DgtError e) noexcept {
  switch (e) {
    case DgtError::kUnavailable:
      return "Unavailable";
    case DgtError::kMalformed:
      return "Malformed";
    case DgtError::kIoLost:
      return "IOLost";
    case DgtError::kTimeout:
      return "Timeout";
    case DgtError::kConnectionLost:
      return "ConnectionLost";
    case DgtError::kClosed:
      return "Closed";
    case DgtError::kDuplicateRequest:
      return "DuplicateRequest";
    case DgtError::kSessionDead:
      return "SessionDead";
    case DgtError::kCancelled:
      return "Cancelled";
    case DgtError::kBadReply:
      return "BadReply";
    case DgtError::kInvalidArgument:
      return "InvalidArgument";
    case DgtError::kWouldDeadlock:
      return "WouldDeadlock";
    default:
      return "Unknown";
  }
}

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * Construct through the named factories success() and error(); never both.
 * Accessing value() on an error (or get_error() on a value) is a programming
 * error caught by DGT_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
  static_assert(std::is_enum<E>::value, "expected<V, E> requires an enum E");

 public:
  static expected success(const V& v) {
    expected r;
    r.Emplace(v);
    return r;
  }

  static expected success(V&& v) {
    expected r;
    r.Emplace(std::move(v));
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    return r;
  }

  expected(const expected& other) : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      Emplace(other.val_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      Emplace(std::move(other.val_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      if (other.has_value_) {
        Emplace(other.val_);
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      if (other.has_value_) {
        Emplace(std::move(other.val_));
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    DGT_ASSERT(has_value_);
    return val_;
  }

  const V& value() const& noexcept {
    DGT_ASSERT(has_value_);
    return val_;
  }

  V&& value() && noexcept {
    DGT_ASSERT(has_value_);
    return std::move(val_);
  }

  E get_error() const noexcept {
    DGT_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const {
    return has_value_ ? val_ : default_val;
  }

 private:
  expected() noexcept : err_(), has_value_(false) {}

  template <typename U>
  void Emplace(U&& v) {
    ::new (static_cast<void*>(&val_)) V(std::forward<U>(v));
    has_value_ = true;
  }

  void Destroy() noexcept {
    if (has_value_) {
      val_.~V();
      has_value_ = false;
      err_ = E();
    }
  }

  union {
    V val_;
    E err_;
  };
  bool has_value_;
};

/** @brief expected<void, E>: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E()); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    DGT_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a cleanup callable when the enclosing scope exits.
 *
 * release() disarms the guard.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> cleanup)
      : cleanup_(std::move(cleanup)), active_(true) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  void release() noexcept { active_ = false; }

 private:
  std::function<void()> cleanup_;
  bool active_;
};

#define DGT_SCOPE_CONCAT_IMPL(a, b) a##b
#define DGT_SCOPE_CONCAT(a, b) DGT_SCOPE_CONCAT_IMPL(a, b)
#define DGT_SCOPE_EXIT(code) \
  ::dgt::ScopeGuard DGT_SCOPE_CONCAT(dgt_scope_exit_, __LINE__)([&]() { code; })

}  // namespace dgt

#endif  // DGT_VOCABULARY_HPP_
