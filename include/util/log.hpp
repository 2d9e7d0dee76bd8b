#pragma once
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <strings.h>

namespace msgstream
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always shown; daemon status lines
};

inline std::atomic<Level> &global_level()
{
    static std::atomic<Level> lv{Level::Info};
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level().store(lv);
}

inline Level log_level()
{
    return global_level().load();
}

// debug/info/warn(ing)/error/err, any case
inline std::optional<Level> level_from_name(const char *name)
{
    if (!name)
        return std::nullopt;
    if (strcasecmp(name, "debug") == 0)
        return Level::Debug;
    if (strcasecmp(name, "info") == 0)
        return Level::Info;
    if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0)
        return Level::Warning;
    if (strcasecmp(name, "error") == 0 || strcasecmp(name, "err") == 0)
        return Level::Error;
    return std::nullopt;
}

// Unknown or missing names select Info.
inline void set_log_level_by_name(const char *name)
{
    set_log_level(level_from_name(name).value_or(Level::Info));
}

inline const char *level_name(Level lv)
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
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
    __attribute__((format(printf, 3, 4)));

// One line per call; lines from the link threads do not interleave.
inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)log_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    char    body[1024];
    va_list ap;
    va_start(ap, fmt);
    int len = std::vsnprintf(body, sizeof(body), fmt, ap);
    va_end(ap);
    if (len < 0)
        body[0] = '\0';

    std::string line = std::string(ts) + " " + level_name(lv) + " " + (func ? func : "?") + ": " +
                       body;
    if (len >= static_cast<int>(sizeof(body)))
        line += "...";
    if (line.back() != '\n')
        line.push_back('\n');

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fputs(line.c_str(), stderr);
}

#define LOG_DEBUG(...) ::msgstream::logf(::msgstream::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::msgstream::logf(::msgstream::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::msgstream::logf(::msgstream::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::msgstream::logf(::msgstream::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::msgstream::logf(::msgstream::Level::System, __func__, __VA_ARGS__)

}  // namespace msgstream
