/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef SHRINK_LOG_SINK_HPP
#define SHRINK_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages, in increasing order.
 */
enum class LogLevel {
    Debug,   ///< Per-file codec details, useful when a file misbehaves
    Info,    ///< Normal progress: files found, reports written
    Warning, ///< Something was skipped or degraded but the run continues
    Error,   ///< A file or the whole run failed
    None     ///< Filter value only: suppresses every message
};

/**
 * @brief Abstract destination for log messages.
 *
 * Implementations decide where messages go (console, file) and which
 * levels they keep. Logger fans every message out to all sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one message.
     * @param level Severity of the message.
     * @param message The message text.
     * @param tag Component that produced the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // SHRINK_LOG_SINK_HPP
