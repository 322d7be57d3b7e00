#include <marshal-cpp/logger.hpp>

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace marshal_cpp {

auto Logger::instance() -> Logger& {
    static auto logger = Logger{};
    return logger;
}

void Logger::set_level(LogLevel level) {
    auto lock = std::scoped_lock{mutex_};
    min_level_ = level;
}

auto Logger::level() const -> LogLevel {
    auto lock = std::scoped_lock{mutex_};
    return min_level_;
}

void Logger::add_sink(LogSink sink) {
    auto lock = std::scoped_lock{mutex_};
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    auto lock = std::scoped_lock{mutex_};
    sinks_.clear();
}

auto Logger::is_enabled(LogLevel level) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return level >= min_level_ && !sinks_.empty();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    auto entry = LogEntry{
        .timestamp = std::chrono::system_clock::now(),
        .level = level,
        .category = std::string{category},
        .message = std::string{message},
    };

    auto lock = std::scoped_lock{mutex_};
    if (level < min_level_) return;
    for (const auto& sink : sinks_) {
        sink(entry);
    }
}

auto Logger::timestamp_to_string(std::chrono::system_clock::time_point tp) -> std::string {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()) % 1000;

    auto tm = std::tm{};
    ::localtime_r(&time, &tm);

    auto ss = std::ostringstream{};
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

namespace sinks {

auto console_sink() -> Logger::LogSink {
    return [](const Logger::LogEntry& entry) {
        std::cerr << Logger::timestamp_to_string(entry.timestamp) << ' '
                  << to_string_view(entry.level) << " ["
                  << entry.category << "] " << entry.message << '\n';
    };
}

auto null_sink() -> Logger::LogSink {
    return [](const Logger::LogEntry&) {};
}

}  // namespace sinks

}  // namespace marshal_cpp
