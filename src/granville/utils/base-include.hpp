
#pragma once

// ------------------------------------------------------------- Library defines

// Turn on 64bit files, stdio.h
#define _FILE_OFFSET_BITS 64

#ifndef __cplusplus
// --------------------------------------------------------------------------- C
#include <assert.h>
#include <stdio.h>

#else
// ------------------------------------------------------------------------- C++

// Contrib
#include <tl/expected.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

#include <fmt/format.h>

#include "base/logging.hpp"

#include <algorithm>
#include <compare>
#include <functional>
#include <memory>
#include <numeric>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <span>

#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <mutex>

namespace granville {
// -----------------------------------------------------------------------------

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;


using std::function;
using thunk_type = std::function<void()>;

using std::array;
using std::map;
using std::optional;
using std::string;
using std::string_view;
using std::unordered_map;
using std::unordered_set;
using std::vector;

using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;
using std::weak_ptr;

using std::begin;
using std::cbegin;
using std::cend;
using std::end;

using std::error_code;

using std::lock_guard;

using namespace std::literals::chrono_literals;

} // namespace granville

#if defined __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
#endif

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)
#else
#define likely(x) (!!(x))
#define unlikely(x) (!!(x))
#endif

// --------------------------------------------------------------------- Logging

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::granville::logging::detail;                                                  \
    ::granville::logging::log_trace(::granville::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#define LOG_DEBUG(fmt, ...)                                                                        \
  {                                                                                                \
    using namespace ::granville::logging::detail;                                                  \
    ::granville::logging::log_debug(::granville::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::granville::logging::detail;                                                  \
    ::granville::logging::log_info(::granville::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,          \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }

#define WARN(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::granville::logging::detail;                                                  \
    ::granville::logging::log_warn(::granville::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,          \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }

#define LOG_ERR(fmt, ...)                                                                          \
  {                                                                                                \
    using namespace ::granville::logging::detail;                                                  \
    ::granville::logging::log_error(::granville::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#define FATAL(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::granville::logging::detail;                                                  \
    ::granville::logging::log_fatal(::granville::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
  if (!likely(condition))                                                                          \
    FATAL("precondition failed: {}", #condition);
#endif

#if defined __clang__
#pragma clang diagnostic pop
#elif defined __GNUC__
#pragma GCC diagnostic pop
#endif

#endif // #defined cplusplus
