/**
 * @file log.hpp
 * @brief The leveled, per module logging used across speechws
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/defines.hpp>

#if defined(SPEECHWS_USE_LOG)

#include <source_location>
#include <string_view>

#define SPEECHWS_LOG_MAKE_LEVEL(name) ::SPEECHWS_NAMESPACE::logging::LogLevel::name
#define SPEECHWS_LOG_SET_LEVEL(level_) ::SPEECHWS_NAMESPACE::logging::setLevel(level_)
#define SPEECHWS_LOG_ADD_WHITELIST(mod) ::SPEECHWS_NAMESPACE::logging::addWhitelist(mod)
#define SPEECHWS_LOG_ADD_BLACKLIST(mod) ::SPEECHWS_NAMESPACE::logging::addBlacklist(mod)
#define SPEECHWS_LOG(level, mod, ...)                                                                 \
    do {                                                                                              \
        if (::SPEECHWS_NAMESPACE::logging::check(level, mod)) {                                       \
            ::SPEECHWS_NAMESPACE::logging::write(                                                     \
                level, mod, std::source_location::current(),                                          \
                ::SPEECHWS_NAMESPACE::fmtlib::format(__VA_ARGS__)                                     \
            );                                                                                        \
        }                                                                                             \
    }                                                                                                 \
    while (0)

SPEECHWS_NS_BEGIN

namespace logging {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

extern auto SPEECHWS_API write(LogLevel level, std::string_view mod, std::source_location where, std::string_view content) -> void;
extern auto SPEECHWS_API check(LogLevel level, std::string_view mod) -> bool;
extern auto SPEECHWS_API setLevel(LogLevel level) -> void;
extern auto SPEECHWS_API addWhitelist(std::string_view mod) -> void;
extern auto SPEECHWS_API addBlacklist(std::string_view mod) -> void;

} // namespace logging

SPEECHWS_NS_END

#else
    // Disable log
    #define SPEECHWS_LOG_MAKE_LEVEL(name) 0
    #define SPEECHWS_LOG_SET_LEVEL(level) do { } while(0)
    #define SPEECHWS_LOG_ADD_WHITELIST(mod) do { } while(0)
    #define SPEECHWS_LOG_ADD_BLACKLIST(mod) do { } while(0)
    #define SPEECHWS_LOG(level, mod, ...) do { } while(0)
#endif

#define SPEECHWS_WARN(mod, ...) SPEECHWS_LOG(SPEECHWS_WARN_LEVEL, mod, __VA_ARGS__)
#define SPEECHWS_ERROR(mod, ...) SPEECHWS_LOG(SPEECHWS_ERROR_LEVEL, mod, __VA_ARGS__)
#define SPEECHWS_INFO(mod, ...) SPEECHWS_LOG(SPEECHWS_INFO_LEVEL, mod, __VA_ARGS__)
#define SPEECHWS_TRACE(mod, ...) SPEECHWS_LOG(SPEECHWS_TRACE_LEVEL, mod, __VA_ARGS__)
#define SPEECHWS_DEBUG(mod, ...) SPEECHWS_LOG(SPEECHWS_DEBUG_LEVEL, mod, __VA_ARGS__)

#define SPEECHWS_TRACE_LEVEL SPEECHWS_LOG_MAKE_LEVEL(Trace)
#define SPEECHWS_DEBUG_LEVEL SPEECHWS_LOG_MAKE_LEVEL(Debug)
#define SPEECHWS_INFO_LEVEL  SPEECHWS_LOG_MAKE_LEVEL(Info)
#define SPEECHWS_WARN_LEVEL  SPEECHWS_LOG_MAKE_LEVEL(Warn)
#define SPEECHWS_ERROR_LEVEL SPEECHWS_LOG_MAKE_LEVEL(Error)
