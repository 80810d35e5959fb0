#pragma once
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string_view>

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

struct logger
{
    static inline log_level g_level = log_info;

    static void log(log_level level, const char* msg)
    {
        if (level < g_level)
            return;

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);

        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);
        std::fprintf(stderr, "[%02d:%02d:%02d.%03d] [%s] %s\n",
            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms), tag(level), msg);
    }

    // printf-style variant; messages longer than the stack buffer are truncated
    __attribute__((format(printf, 2, 3)))
    static void logf(log_level level, const char* fmt, ...)
    {
        if (level < g_level)
            return;

        char buf[1024];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        log(level, buf);
    }

    static const char* tag(log_level level)
    {
        switch (level)
        {
            case log_debug: return "DEBUG";
            case log_info:  return "INFO";
            case log_warn:  return "WARN";
            case log_error: return "ERROR";
        }
        return "?";
    }

    static bool parse_level(std::string_view str, log_level& out)
    {
        if (str == "debug") { out = log_debug; return true; }
        if (str == "info")  { out = log_info;  return true; }
        if (str == "warn")  { out = log_warn;  return true; }
        if (str == "error") { out = log_error; return true; }
        return false;
    }
};

#define LOG_DEBUG(msg) do { if (logger::g_level <= log_debug) logger::log(log_debug, msg); } while(0)
#define LOG_INFO(msg)  do { if (logger::g_level <= log_info)  logger::log(log_info,  msg); } while(0)
#define LOG_WARN(msg)  do { if (logger::g_level <= log_warn)  logger::log(log_warn,  msg); } while(0)
#define LOG_ERROR(msg) do { if (logger::g_level <= log_error) logger::log(log_error, msg); } while(0)

#define LOG_DEBUGF(...) do { if (logger::g_level <= log_debug) logger::logf(log_debug, __VA_ARGS__); } while(0)
#define LOG_INFOF(...)  do { if (logger::g_level <= log_info)  logger::logf(log_info,  __VA_ARGS__); } while(0)
#define LOG_WARNF(...)  do { if (logger::g_level <= log_warn)  logger::logf(log_warn,  __VA_ARGS__); } while(0)
#define LOG_ERRORF(...) do { if (logger::g_level <= log_error) logger::logf(log_error, __VA_ARGS__); } while(0)
