/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Logger is the single entry point for diagnostics in libshrink and the
 * CLI. It does not print anything by itself: messages are delivered to the
 * registered ILogSink instances, so a library user that installs no sink
 * gets a silent library.
 */

#ifndef SHRINK_LOGGER_HPP
#define SHRINK_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation; null is ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// Remove every registered sink.
    static void clear_sinks();

    /**
     * @brief Send a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "shrink").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "shrink");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted by --log-level.
     *
     * Case-sensitive. "WARN" and "WARNING" are both accepted. Unknown
     * names map to LogLevel::Error.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        if (level == "NONE")
            return LogLevel::None;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_; ///< Registered sinks
    static std::mutex mtx_;                               ///< Guards sinks_ and serialises delivery
};

#endif // SHRINK_LOGGER_HPP
