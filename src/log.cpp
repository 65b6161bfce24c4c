#include <speechws/log.hpp>
#include <algorithm>
#include <string>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <set>

#if defined(SPEECHWS_USE_LOG)

#if defined(SPEECHWS_USE_SPDLOG)
    #include <spdlog/spdlog.h>
#endif

SPEECHWS_NS_BEGIN

namespace logging {

namespace {
    struct CaseCmp {
        using is_transparent = void;

        bool operator()(std::string_view a, std::string_view b) const {
            return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) < std::tolower(static_cast<unsigned char>(b));
            });
        }
    };

    struct Context {
        std::mutex mutex; // Guard the lists, the loop may post from other threads
        LogLevel level = LogLevel::Info;
        std::set<std::string, CaseCmp> whitelist;
        std::set<std::string, CaseCmp> blacklist;
    };

    auto instance() -> Context & {
        static Context ctxt;
        return ctxt;
    }

    auto levelString(LogLevel level) -> std::string_view {
        switch (level) {
            case LogLevel::Trace: return "TRACE";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO ";
            case LogLevel::Warn:  return "WARN ";
            case LogLevel::Error: return "ERROR";
            default: return "?????";
        }
    }

    auto levelColor(LogLevel level) -> const char * {
        switch (level) {
            case LogLevel::Trace: return "\033[38;5;244m";
            case LogLevel::Debug: return "\033[38;5;75m";
            case LogLevel::Info:  return "\033[38;5;113m";
            case LogLevel::Warn:  return "\033[38;5;220m";
            case LogLevel::Error: return "\033[38;5;196m";
            default: return "\033[0m";
        }
    }

#if defined(SPEECHWS_USE_SPDLOG)
    auto toSpdlog(LogLevel level) -> spdlog::level::level_enum {
        switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:  return spdlog::level::info;
            case LogLevel::Warn:  return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Off:   return spdlog::level::off;
        }
        return spdlog::level::info;
    }
#endif
}

auto check(LogLevel level, std::string_view mod) -> bool {
    auto &ctxt = instance();
    std::lock_guard lock(ctxt.mutex);
    if (int(level) < int(ctxt.level)) {
        return false;
    }
    if (ctxt.blacklist.contains(mod)) {
        return false;
    }
    if (!ctxt.whitelist.empty() && !ctxt.whitelist.contains(mod)) {
        return false;
    }
    return true;
}

auto write(LogLevel level, std::string_view mod, std::source_location where, std::string_view content) -> void {
#if defined(SPEECHWS_USE_SPDLOG)
    spdlog::source_loc loc(where.file_name(), int(where.line()), where.function_name());
    spdlog::log(loc, toSpdlog(level), "[{}] {}", mod, content);
#else
    std::string buf;
    buf += levelColor(level);

    // Only keep the file name
    auto file = std::string_view(where.file_name());
    if (auto pos = file.find_last_of('/'); pos != std::string_view::npos) {
        file = file.substr(pos + 1);
    }
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    fmtlib::format_to(std::back_inserter(buf), "[{:%F %T}] [{}/{}]: [{}:{}] ", now, levelString(level), mod, file, where.line());

    buf += "\033[0m";
    buf += content;
    buf += "\n";

    ::fputs(buf.c_str(), stderr);
#endif

}

auto setLevel(LogLevel level) -> void {
    auto &ctxt = instance();
    std::lock_guard lock(ctxt.mutex);
    ctxt.level = level;
}

auto addWhitelist(std::string_view mod) -> void {
    auto &ctxt = instance();
    std::lock_guard lock(ctxt.mutex);
    ctxt.whitelist.insert(std::string(mod));
}

auto addBlacklist(std::string_view mod) -> void {
    auto &ctxt = instance();
    std::lock_guard lock(ctxt.mutex);
    ctxt.blacklist.insert(std::string(mod));
}

} // namespace logging

SPEECHWS_NS_END

#endif
