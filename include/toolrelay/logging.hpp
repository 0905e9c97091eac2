#pragma once

#include <functional>
#include <string>

namespace toolrelay
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

/// Parse a level name ("debug", "INFO", "warn", ...). Unknown names map to Info.
LogLevel parse_log_level(const std::string& name);

using LogSink = std::function<void(LogLevel, const std::string&)>;

/// Messages below the threshold are dropped before reaching the sink
void set_log_level(LogLevel level);
LogLevel log_level();

/// Replace the process-wide sink. Passing nullptr restores the stderr sink.
void set_log_sink(LogSink sink);

void log(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message)
{
    log(LogLevel::Debug, message);
}
inline void log_info(const std::string& message)
{
    log(LogLevel::Info, message);
}
inline void log_warning(const std::string& message)
{
    log(LogLevel::Warning, message);
}
inline void log_error(const std::string& message)
{
    log(LogLevel::Error, message);
}

} // namespace toolrelay
