#include "toolrelay/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace toolrelay
{

namespace
{

std::atomic<LogLevel> g_threshold{LogLevel::Info};
std::mutex g_sink_mutex;
LogSink g_sink;

std::string local_timestamp()
{
    using clock = std::chrono::system_clock;
    std::time_t t = clock::to_time_t(clock::now());
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void stderr_sink(LogLevel level, const std::string& message)
{
    std::cerr << local_timestamp() << " - " << to_string(level) << " - " << message << std::endl;
}

} // namespace

LogLevel parse_log_level(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG" || upper == "TRACE")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_level(LogLevel level)
{
    g_threshold = level;
}

LogLevel log_level()
{
    return g_threshold.load();
}

void set_log_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void log(LogLevel level, const std::string& message)
{
    if (static_cast<int>(level) < static_cast<int>(g_threshold.load()))
        return;

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink)
        g_sink(level, message);
    else
        stderr_sink(level, message);
}

} // namespace toolrelay
