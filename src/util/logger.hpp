#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <mutex>

namespace pixel_forge {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static void set_level(LogLevel level) { s_level = level; }
    static LogLevel get_level() { return s_level; }

    // Accepts "debug", "info", "warn" and "error"; anything else keeps `fallback`
    static LogLevel parse_level(const char* name, LogLevel fallback) {
        if (!name) return fallback;
        if (strcmp(name, "debug") == 0) return LogLevel::DEBUG;
        if (strcmp(name, "info") == 0) return LogLevel::INFO;
        if (strcmp(name, "warn") == 0) return LogLevel::WARN;
        if (strcmp(name, "error") == 0) return LogLevel::ERROR;
        return fallback;
    }

    static void debug(const char* fmt, ...) {
        if (s_level <= LogLevel::DEBUG) {
            va_list args;
            va_start(args, fmt);
            log_impl("DEBUG", fmt, args);
            va_end(args);
        }
    }

    static void info(const char* fmt, ...) {
        if (s_level <= LogLevel::INFO) {
            va_list args;
            va_start(args, fmt);
            log_impl("INFO", fmt, args);
            va_end(args);
        }
    }

    static void warn(const char* fmt, ...) {
        if (s_level <= LogLevel::WARN) {
            va_list args;
            va_start(args, fmt);
            log_impl("WARN", fmt, args);
            va_end(args);
        }
    }

    static void error(const char* fmt, ...) {
        if (s_level <= LogLevel::ERROR) {
            va_list args;
            va_start(args, fmt);
            log_impl("ERROR", fmt, args);
            va_end(args);
        }
    }

private:
    static inline LogLevel s_level = LogLevel::WARN;
    static inline std::mutex s_mutex;

    static void log_impl(const char* level, const char* fmt, va_list args) {
        char msg[1024];
        vsnprintf(msg, sizeof(msg), fmt, args);

        time_t now = time(nullptr);
        struct tm tm_info;
#ifdef _WIN32
        localtime_s(&tm_info, &now);
#else
        localtime_r(&now, &tm_info);
#endif
        char time_buf[20];
        strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_info);

        // Capture thread and consumer threads log concurrently
        std::lock_guard<std::mutex> lock(s_mutex);
        fprintf(stderr, "[%s] [%s] %s\n", time_buf, level, msg);
    }
};

#define LOG_DEBUG(...) pixel_forge::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  pixel_forge::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  pixel_forge::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) pixel_forge::Logger::error(__VA_ARGS__)

}  // namespace pixel_forge
