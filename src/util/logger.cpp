#include "respkv/util/logger.hpp"

#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <thread>

#include "respkv/util/strings.hpp"

namespace respkv::util {

namespace {

constexpr std::string_view kLevelNames[] = {"debug", "info", "warn", "error", "none"};

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower = to_lower(name);
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    for (std::size_t i = 0; i < std::size(kLevelNames); ++i) {
        if (lower == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

std::string_view log_level_name(LogLevel level) {
    auto index = static_cast<std::size_t>(level);
    return index < std::size(kLevelNames) ? kLevelNames[index] : "info";
}

// function-local static: built on first use, initialization is thread-safe
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::debug(std::string_view message) {
    log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
    log(LogLevel::Info, message);
}

void Logger::warn(std::string_view message) {
    log(LogLevel::Warn, message);
}

void Logger::error(std::string_view message) {
    log(LogLevel::Error, message);
}

// "2024-01-15 10:30:45.123 [WARN ] [140213] message". warn and error go to stderr
void Logger::log(LogLevel level, std::string_view message) {
    if (level == LogLevel::None || level < level_.load()) {
        return;
    }

    std::ostringstream line;
    line << timestamp() << " [" << std::left << std::setw(5) << to_upper(log_level_name(level))
         << "] [" << std::this_thread::get_id() << "] " << message << '\n';

    std::lock_guard lock(mutex_);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << line.str();
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    // localtime() shares a static buffer between threads
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return oss.str();
}

}  // namespace respkv::util
