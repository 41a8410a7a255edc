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
 * @brief Platform detection, compiler hints and the DGT_ASSERT macro.
 */

#ifndef DGT_PLATFORM_HPP_
#define DGT_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace dgt {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define DGT_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define DGT_PLATFORM_MACOS 1
#endif

#if defined(DGT_PLATFORM_LINUX) || defined(DGT_PLATFORM_MACOS)
#define DGT_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define DGT_LIKELY(x) __builtin_expect(!!(x), 1)
#define DGT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define DGT_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define DGT_LIKELY(x) (x)
#define DGT_UNLIKELY(x) (x)
#define DGT_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define DGT_HAS_EXCEPTIONS 1
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when a DGT_ASSERT fails in debug builds.
 *
 * Reports the condition and location on stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "DGT_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define DGT_ASSERT(cond) ((void)0)
#else
#define DGT_ASSERT(cond) \
  ((cond) ? ((void)0) : ::dgt::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace dgt

#endif  // DGT_PLATFORM_HPP_
