#pragma once

/**
 * @file defines.hpp
 * @brief Common macros, platform types and the formatting glue
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <speechws/detail/config.hpp>
#include <concepts>
#include <cstdint>
#include <cstddef>
#include <version>
#include <string>

#if !defined(SPEECHWS_NAMESPACE)
    #define SPEECHWS_NAMESPACE speechws
#endif

#if !defined(SPEECHWS_ASSERT)
    #define SPEECHWS_ASSERT(x) assert(x)
    #include <cassert>
#endif

#if defined(SPEECHWS_USE_FMT)
    #define SPEECHWS_FMT_NAMESPACE fmt
    #include <fmt/format.h>
    #include <fmt/chrono.h>
#else
    #error "speechws requires fmt, configure with SPEECHWS_USE_FMT"
#endif

#if !defined(__linux__)
    #error "Unsupported platform, speechws is built on epoll"
#endif

// Compiler check
#if defined(__GNUC__)
    #define SPEECHWS_ATTRIBUTE(x) __attribute__((x))
    #define SPEECHWS_UNREACHABLE() __builtin_unreachable()
#else
    #define SPEECHWS_ATTRIBUTE(x) // no-op
    #define SPEECHWS_UNREACHABLE() // no-op
#endif

// Library mode
#if defined(_SPEECHWS_SOURCE)
    #define SPEECHWS_API SPEECHWS_ATTRIBUTE(visibility("default"))
#else
    #define SPEECHWS_API
#endif

// Utils macro
#define SPEECHWS_ASSERT_MSG(x, msg) SPEECHWS_ASSERT((x) && (msg))
#define SPEECHWS_STRINGIFY_(x) #x
#define SPEECHWS_STRINGIFY(x) SPEECHWS_STRINGIFY_(x)
#define SPEECHWS_NS_BEGIN namespace SPEECHWS_NAMESPACE {
#define SPEECHWS_NS_END }

#define SPEECHWS_VERSION_STRING                                      \
    SPEECHWS_STRINGIFY(SPEECHWS_VERSION_MAJOR) "."                   \
    SPEECHWS_STRINGIFY(SPEECHWS_VERSION_MINOR) "."                   \
    SPEECHWS_STRINGIFY(SPEECHWS_VERSION_PATCH)

// Formatter macro
#define SPEECHWS_FORMATTER(type)                                         \
    template <>                                                          \
    struct SPEECHWS_FMT_NAMESPACE::formatter<SPEECHWS_NAMESPACE::type> : \
        SPEECHWS_NAMESPACE::detail::DefaultFormatter

SPEECHWS_NS_BEGIN

// Basic platform types
using fd_t    = int;
using error_t = int;

// Common Concepts
template <typename T>
concept IntoString = requires (const T &t) {
    toString(t);
};

namespace fmtlib = SPEECHWS_FMT_NAMESPACE;

namespace detail {

// The Helper class for formatting, default parse and redirect format_to into fmtlib
struct DefaultFormatter {
    constexpr auto parse(auto &ctxt) const noexcept {
        return ctxt.begin();
    }

    template <typename It, typename ...Args>
    static auto format_to(It &&it, fmtlib::format_string<Args...> fmt, Args &&...args) {
        return fmtlib::format_to(it, fmt, std::forward<Args>(args)...);
    }
};

} // namespace detail

// Utils
template <typename T> requires requires(const T &t) { t.toString(); }
inline auto toString(const T &t) {
    return t.toString();
}

SPEECHWS_NS_END

// Make formatter for all type with IntoString concept
template <SPEECHWS_NAMESPACE::IntoString T>
struct SPEECHWS_FMT_NAMESPACE::formatter<T> : SPEECHWS_NAMESPACE::detail::DefaultFormatter {
    auto format(const T &value, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", toString(value));
    }
};
