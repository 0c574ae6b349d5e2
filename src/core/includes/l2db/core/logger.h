#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace l2db {

// ANSI color codes for terminal output
namespace color {
inline constexpr const char* RESET = "\033[0m";
inline constexpr const char* RED = "\033[0;31m";
inline constexpr const char* GREEN = "\033[0;32m";
inline constexpr const char* YELLOW = "\033[0;33m";
inline constexpr const char* CYAN = "\033[0;36m";
inline constexpr const char* BOLD_RED = "\033[1;31m";
inline constexpr const char* BOLD_YELLOW = "\033[1;33m";
}  // namespace color

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
#ifdef _WIN32
        localtime_s(&tm_now, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_now);
#endif

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

    static const char*
    level_prefix(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::ERROR:
                return "[ERROR] ";
            case LogLevel::WARNING:
                return "[WARN]  ";
            case LogLevel::INFO:
                return "[INFO]  ";
            case LogLevel::DEBUG:
                return "[DEBUG] ";
            default:
                return "";
        }
    }

    static void
    emit(LogLevel level, const std::string& line)
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::ostream* out = (level <= LogLevel::WARNING)
            ? (error_stream_ ? error_stream_ : &std::cerr)
            : (output_stream_ ? output_stream_ : &std::cout);
        *out << line << std::endl;
    }

public:
    static void
    set_level(LogLevel level);

    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect info/debug output (nullptr restores std::cout)
    static void
    set_output_stream(std::ostream* output_stream);

    // Redirect warning/error output (nullptr restores std::cerr)
    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;
        write(level, args...);
    }

    // Emit without consulting the global level (partitions filter first)
    template <typename... Args>
    static void
    write(LogLevel level, const Args&... args)
    {
        // Format before taking the lock
        std::ostringstream oss;
        oss << format_timestamp() << level_prefix(level);
        (oss << ... << args);
        emit(level, oss.str());
    }
};

namespace detail {
template <typename T>
class has_log_partition
{
    template <typename C>
    static constexpr auto
    test(int) -> decltype(C::get_log_partition(), bool())
    {
        return true;
    }

    template <typename>
    static constexpr bool
    test(...)
    {
        return false;
    }

public:
    static constexpr bool value = test<T>(0);
};

template <typename T, typename... Args>
inline void
log_with_partition_check(
    LogLevel level,
    const char* file,
    int line,
    const T* /* obj */,
    const Args&... args)
{
    if constexpr (has_log_partition<T>::value)
    {
        auto& partition = T::get_log_partition();
        if (partition.should_log(level))
        {
            Logger::write(
                level,
                "[",
                partition.name(),
                "] ",
                args...,
                " (",
                file,
                ":",
                line,
                ")");
        }
    }
    else
    {
        if (Logger::get_level() >= level)
        {
            Logger::log(level, args..., " (", file, ":", line, ")");
        }
    }
}
}  // namespace detail

/**
 * Named logging scope with its own level.
 *
 * A class opts in by exposing a static get_log_partition() returning a
 * LogPartition&; the OLOG* macros then prefix its name and honour its level.
 */
class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

private:
    std::string name_;
    LogLevel level_;
};

}  // namespace l2db

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define __RELATIVE_FILEPATH__                                  \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

// Class-aware logging macros, file and line appended
#define OLOGE(...)                                 \
    ::l2db::detail::log_with_partition_check(      \
        ::l2db::LogLevel::ERROR,                   \
        __RELATIVE_FILEPATH__,                     \
        __LINE__,                                  \
        this,                                      \
        __VA_ARGS__)
#define OLOGW(...)                                 \
    ::l2db::detail::log_with_partition_check(      \
        ::l2db::LogLevel::WARNING,                 \
        __RELATIVE_FILEPATH__,                     \
        __LINE__,                                  \
        this,                                      \
        __VA_ARGS__)
#define OLOGI(...)                                 \
    ::l2db::detail::log_with_partition_check(      \
        ::l2db::LogLevel::INFO,                    \
        __RELATIVE_FILEPATH__,                     \
        __LINE__,                                  \
        this,                                      \
        __VA_ARGS__)
#define OLOGD(...)                                 \
    ::l2db::detail::log_with_partition_check(      \
        ::l2db::LogLevel::DEBUG,                   \
        __RELATIVE_FILEPATH__,                     \
        __LINE__,                                  \
        this,                                      \
        __VA_ARGS__)

#define LOGE(...)                  \
    ::l2db::Logger::log(           \
        ::l2db::LogLevel::ERROR,   \
        __VA_ARGS__,               \
        " (",                      \
        __RELATIVE_FILEPATH__,     \
        ":",                       \
        __LINE__,                  \
        ")")
#define LOGW(...)                                                 \
    if (::l2db::Logger::get_level() >= ::l2db::LogLevel::WARNING) \
    ::l2db::Logger::log(                                          \
        ::l2db::LogLevel::WARNING,                                \
        __VA_ARGS__,                                              \
        " (",                                                     \
        __RELATIVE_FILEPATH__,                                    \
        ":",                                                      \
        __LINE__,                                                 \
        ")")
#define LOGI(...)                                              \
    if (::l2db::Logger::get_level() >= ::l2db::LogLevel::INFO) \
    ::l2db::Logger::log(                                       \
        ::l2db::LogLevel::INFO,                                \
        __VA_ARGS__,                                           \
        " (",                                                  \
        __RELATIVE_FILEPATH__,                                 \
        ":",                                                   \
        __LINE__,                                              \
        ")")
#define LOGD(...)                                               \
    if (::l2db::Logger::get_level() >= ::l2db::LogLevel::DEBUG) \
    ::l2db::Logger::log(                                        \
        ::l2db::LogLevel::DEBUG,                                \
        __VA_ARGS__,                                            \
        " (",                                                   \
        __RELATIVE_FILEPATH__,                                  \
        ":",                                                    \
        __LINE__,                                               \
        ")")
