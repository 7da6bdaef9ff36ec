#ifndef RESPKV_UTIL_LOGGER_HPP
#define RESPKV_UTIL_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace respkv::util {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    None = 4
};

// "debug", "info", "warn", "error", "none" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

// process-wide, thread-safe. lines below the current level are dropped before formatting
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

private:
    Logger() = default;

    [[nodiscard]] std::string timestamp() const;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

// convenience macros
#define LOG_DEBUG(msg) respkv::util::Logger::instance().debug(msg)
#define LOG_INFO(msg) respkv::util::Logger::instance().info(msg)
#define LOG_WARN(msg) respkv::util::Logger::instance().warn(msg)
#define LOG_ERROR(msg) respkv::util::Logger::instance().error(msg)

}  // namespace respkv::util

#endif
