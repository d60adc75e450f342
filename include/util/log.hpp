#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace qrxfer
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-facing status lines (progress, saved files), never filtered
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

// Unknown names fall back to Info.
inline Level level_from_name(const std::string &name)
{
    std::string lv;
    lv.reserve(name.size());
    for (char c : name)
        lv.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lv == "debug")
        return Level::Debug;
    if (lv == "warn" || lv == "warning")
        return Level::Warning;
    if (lv == "error" || lv == "err")
        return Level::Error;
    return Level::Info;
}

inline void set_log_level_by_name(const char *name)
{
    set_log_level(level_from_name(name ? std::string(name) : std::string()));
}

// QRXFER_LOG_LEVEL=debug|info|warn|error
inline void init_log_from_env(const char *env_var = "QRXFER_LOG_LEVEL")
{
    if (const char *v = std::getenv(env_var); v && *v)
        set_log_level_by_name(v);
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
{
    if (lv != Level::System && (int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // one line per call even when the play loop and the ipc server log concurrently
    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::qrxfer::logf(::qrxfer::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::qrxfer::logf(::qrxfer::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::qrxfer::logf(::qrxfer::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::qrxfer::logf(::qrxfer::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::qrxfer::logf(::qrxfer::Level::System, __func__, __VA_ARGS__)

}  // namespace qrxfer
