#pragma once

#include <cstdint>
#include <expected>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace Mtree {

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

[[nodiscard]] std::string_view log_level_name(LogLevel level) noexcept;

// 不区分大小写，"warn" 作为 "warning" 的别名
[[nodiscard]]
auto parse_log_level(std::string_view name) -> std::expected<LogLevel, std::error_code>;

/**
 * @brief Process-wide leveled logger.
 *
 * Lines are written as `YYYY-mm-dd HH:MM:SS [LEVEL] message` to stderr unless
 * another sink is installed. All members are safe to call concurrently.
 */
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, std::string_view message);

    void trace(std::string_view message) { log(LogLevel::Trace, message); }
    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warning(std::string_view message) { log(LogLevel::Warning, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }
    void critical(std::string_view message) { log(LogLevel::Critical, message); }

    [[nodiscard]] LogLevel level() const;
    void set_level(LogLevel level);
    [[nodiscard]] bool is_level_enabled(LogLevel level) const { return level >= this->level(); }

    // sink 必须在被替换或进程结束前保持有效
    void set_sink(std::ostream& sink);
    void reset_sink();

private:
    Logger();

    static std::string current_timestamp();

    mutable std::mutex mutex_;
    std::ostream* sink_;
    LogLevel min_level_ = LogLevel::Warning;
};

} // namespace Mtree
