#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace chunkcast
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // config summaries and lifecycle banners, never filtered
};

inline std::atomic<int> &threshold()
{
    static std::atomic<int> lv{static_cast<int>(Level::Info)};
    return lv;
}

inline void set_log_level(Level lv)
{
    // System is not a threshold; clamp so errors stay visible
    threshold().store(static_cast<int>(std::min(lv, Level::Error)));
}

inline Level log_level()
{
    return static_cast<Level>(threshold().load());
}

// Case-insensitive: debug, info, warn|warning, error|err
inline std::optional<Level> parse_level(std::string_view name)
{
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug")
        return Level::Debug;
    if (s == "info")
        return Level::Info;
    if (s == "warn" || s == "warning")
        return Level::Warning;
    if (s == "error" || s == "err")
        return Level::Error;
    return std::nullopt;
}

// Unknown names select Info and return false so the caller can complain.
inline bool set_log_level_by_name(std::string_view name)
{
    auto lv = parse_level(name);
    set_log_level(lv.value_or(Level::Info));
    return lv.has_value();
}

inline const char *level_tag(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "[?]";
}

// Peer ids are long hex strings; logs only need a recognisable prefix.
inline std::string short_id(std::string_view id, std::size_t n = 8)
{
    return std::string(id.substr(0, n));
}

using LogSink = std::function<void(Level, const std::string &)>;

namespace detail
{

inline std::mutex &sink_mutex()
{
    static std::mutex mu;
    return mu;
}

inline LogSink &sink()
{
    static LogSink s;
    return s;
}

inline std::string clock_now()
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(ms.count()));
    return buf;
}

}  // namespace detail

// Redirect formatted lines (without trailing newline); empty restores stderr.
inline void set_log_sink(LogSink s)
{
    std::lock_guard<std::mutex> lk(detail::sink_mutex());
    detail::sink() = std::move(s);
}

// "HH:MM:SS.mmm [LEVEL] func: message"
inline std::string format_line(Level lv, const char *func, const char *fmt, va_list ap)
{
    std::string line = detail::clock_now();
    line += ' ';
    line += level_tag(lv);
    line += ' ';
    line += func ? func : "?";
    line += ": ";

    va_list cp;
    va_copy(cp, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, cp);
    va_end(cp);
    if (n > 0)
    {
        std::string body(static_cast<std::size_t>(n) + 1, '\0');
        std::vsnprintf(body.data(), body.size(), fmt, ap);
        body.resize(static_cast<std::size_t>(n));
        line += body;
    }
    while (!line.empty() && line.back() == '\n')
        line.pop_back();
    return line;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (lv != Level::System && static_cast<int>(lv) < threshold().load())
        return;

    va_list ap;
    va_start(ap, fmt);
    std::string line = format_line(lv, func, fmt, ap);
    va_end(ap);

    // transport callbacks and timer threads log concurrently
    std::lock_guard<std::mutex> lk(detail::sink_mutex());
    if (detail::sink())
    {
        detail::sink()(lv, line);
        return;
    }
    line += '\n';
    std::fputs(line.c_str(), stderr);
}

#define LOG_DEBUG(...) ::chunkcast::logf(::chunkcast::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::chunkcast::logf(::chunkcast::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::chunkcast::logf(::chunkcast::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::chunkcast::logf(::chunkcast::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::chunkcast::logf(::chunkcast::Level::System, __func__, __VA_ARGS__)

}  // namespace chunkcast
