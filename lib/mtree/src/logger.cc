#include "mtree/logger.hpp"
#include "mtree/error.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Mtree {

std::string_view log_level_name(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Critical:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

auto parse_log_level(std::string_view name) -> std::expected<LogLevel, std::error_code>
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "WARN") {
        return LogLevel::Warning;
    }
    for (auto level : { LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
             LogLevel::Warning, LogLevel::Error, LogLevel::Critical }) {
        if (upper == log_level_name(level)) {
            return level;
        }
    }
    return std::unexpected(make_error_code(Error::InvalidArgument));
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

Logger::Logger()
    : sink_(&std::cerr)
{
}

void Logger::log(LogLevel level, std::string_view message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    *sink_ << current_timestamp() << " [" << log_level_name(level) << "] " << message << '\n';
    if (level >= LogLevel::Error) {
        sink_->flush();
    }
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::set_sink(std::ostream& sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = &sink;
}

void Logger::reset_sink()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = &std::cerr;
}

std::string Logger::current_timestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf {};
    localtime_r(&now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace Mtree
