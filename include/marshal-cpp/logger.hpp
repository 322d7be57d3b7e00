/// @file logger.hpp
/// @brief Category logger with pluggable sinks.
///
/// The library logs through MARSHAL_CPP_LOG_* macros. Nothing is printed
/// until a sink is added; the default threshold is LogLevel::warning.
///
/// @code
/// marshal_cpp::Logger::instance().set_level(marshal_cpp::LogLevel::debug);
/// marshal_cpp::Logger::instance().add_sink(marshal_cpp::sinks::console_sink());
/// @endcode

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace marshal_cpp {

enum class LogLevel : std::uint8_t {
    trace    = 0,
    debug    = 1,
    info     = 2,
    warning  = 3,
    error    = 4,
    critical = 5,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace:    return "TRACE";
        case LogLevel::debug:    return "DEBUG";
        case LogLevel::info:     return "INFO";
        case LogLevel::warning:  return "WARN";
        case LogLevel::error:    return "ERROR";
        case LogLevel::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

class Logger {
public:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string category;
        std::string message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static auto instance() -> Logger&;

    void set_level(LogLevel level);
    auto level() const -> LogLevel;

    void add_sink(LogSink sink);
    void clear_sinks();

    auto is_enabled(LogLevel level) const -> bool;

    void log(LogLevel level, std::string_view category, std::string_view message);

    /// Log with `{}` placeholders replaced by the arguments, in order.
    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category,
                       std::string_view format, Args&&... args) {
        if (!is_enabled(level)) return;
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }

    static auto timestamp_to_string(std::chrono::system_clock::time_point tp) -> std::string;

    Logger(const Logger&) = delete;
    auto operator=(const Logger&) -> Logger& = delete;

private:
    Logger() = default;

    template <typename T>
    static auto arg_to_string(T&& v) -> std::string {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<D, std::string_view>) {
            return std::string{v};
        } else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>) {
            return v ? std::string{v} : std::string{"(null)"};
        } else if constexpr (std::is_same_v<D, bool>) {
            return v ? "true" : "false";
        } else {
            return std::to_string(v);
        }
    }

    template <typename... Args>
    static auto format_message(std::string_view format, Args&&... args) -> std::string {
        auto result = std::string{format};
        auto cursor = std::size_t{0};
        auto replace_next = [&](auto&& arg) {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos) return;
            auto text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (replace_next(std::forward<Args>(args)), ...);
        return result;
    }

    mutable std::mutex mutex_;
    LogLevel min_level_{LogLevel::warning};
    std::vector<LogSink> sinks_;
};

namespace sinks {

/// Writes "timestamp LEVEL [category] message" lines to stderr.
auto console_sink() -> Logger::LogSink;

/// Discards every entry.
auto null_sink() -> Logger::LogSink;

}  // namespace sinks

}  // namespace marshal_cpp

#define MARSHAL_CPP_LOG(level, category, ...)                                         \
    do {                                                                              \
        if (::marshal_cpp::Logger::instance().is_enabled(level)) {                    \
            ::marshal_cpp::Logger::instance().log_formatted(level, category,          \
                                                            __VA_ARGS__);             \
        }                                                                             \
    } while (0)

#define MARSHAL_CPP_LOG_TRACE(category, ...) \
    MARSHAL_CPP_LOG(::marshal_cpp::LogLevel::trace, category, __VA_ARGS__)
#define MARSHAL_CPP_LOG_DEBUG(category, ...) \
    MARSHAL_CPP_LOG(::marshal_cpp::LogLevel::debug, category, __VA_ARGS__)
#define MARSHAL_CPP_LOG_INFO(category, ...) \
    MARSHAL_CPP_LOG(::marshal_cpp::LogLevel::info, category, __VA_ARGS__)
#define MARSHAL_CPP_LOG_WARN(category, ...) \
    MARSHAL_CPP_LOG(::marshal_cpp::LogLevel::warning, category, __VA_ARGS__)
#define MARSHAL_CPP_LOG_ERROR(category, ...) \
    MARSHAL_CPP_LOG(::marshal_cpp::LogLevel::error, category, __VA_ARGS__)
