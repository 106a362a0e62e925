#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace
{
    std::atomic<LogLevel> g_level{LogLevel::Info};
    std::mutex g_sink_mutex;
    std::function<void(LogLevel, const std::string &)> g_callback;

    const char *level_tag(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO ";
        case LogLevel::Warning:
            return "WARN ";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "     ";
        }
    }
}

void set_log_level(LogLevel level)
{
    g_level = level;
}

LogLevel get_log_level()
{
    return g_level;
}

LogLevel parse_log_level(const std::string &name)
{
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warning")
        return LogLevel::Warning;
    if (name == "error")
        return LogLevel::Error;
    throw std::invalid_argument("Unknown log level: " + name);
}

void set_log_callback(std::function<void(LogLevel, const std::string &)> callback)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_callback = std::move(callback);
}

void log_message(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_callback)
    {
        g_callback(level, message);
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local_tm;
    localtime_r(&seconds, &local_tm);

    std::cerr << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
              << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
              << " [" << level_tag(level) << "] " << message << std::endl;
}
