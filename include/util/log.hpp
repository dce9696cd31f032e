#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <optional>
#include <string>

namespace qrdrive
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-facing progress, always shown
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline std::optional<Level> parse_level(const std::string &level)
{
    if (level == "debug" || level == "DEBUG")
        return Level::Debug;
    if (level == "info" || level == "INFO")
        return Level::Info;
    if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        return Level::Warning;
    if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        return Level::Error;
    return std::nullopt;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    auto lv = parse_level(name ? std::string(name) : std::string{});
    set_log_level(lv ? *lv : Level::Info);
}

// Applies QRDRIVE_LOG_LEVEL when set; returns true if the variable was present.
inline bool init_log_from_env()
{
    const char *e = std::getenv("QRDRIVE_LOG_LEVEL");
    if (!e || !*e)
        return false;
    set_log_level_by_name(e);
    return true;
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

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::qrdrive::logf(::qrdrive::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::qrdrive::logf(::qrdrive::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::qrdrive::logf(::qrdrive::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::qrdrive::logf(::qrdrive::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::qrdrive::logf(::qrdrive::Level::System, __func__, __VA_ARGS__)

}  // namespace qrdrive
