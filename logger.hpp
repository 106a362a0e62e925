#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <functional>
#include <sstream>
#include <string>
#include <utility>

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    None = 4,
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses "debug", "info", "warning" or "error". Throws std::invalid_argument otherwise.
LogLevel parse_log_level(const std::string &name);

// Replaces the stderr sink, e.g. to capture lines in tests. Pass nullptr to restore it.
void set_log_callback(std::function<void(LogLevel, const std::string &)> callback);

void log_message(LogLevel level, const std::string &message);

template <typename... Args>
std::string log_format(Args &&...args)
{
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    return out.str();
}

#define LOG_AT(level, ...)                                        \
    do                                                            \
    {                                                             \
        if (get_log_level() <= (level))                           \
            log_message((level), log_format(__VA_ARGS__));        \
    } while (0)

#define LOG_DEBUG(...) LOG_AT(LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) LOG_AT(LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) LOG_AT(LogLevel::Warning, __VA_ARGS__)
#define LOG_ERROR(...) LOG_AT(LogLevel::Error, __VA_ARGS__)

#endif
