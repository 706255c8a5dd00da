#ifndef SHRINK_CONSOLE_LOG_SINK_HPP
#define SHRINK_CONSOLE_LOG_SINK_HPP

#include "../../../libshrink/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>

/**
 * @brief Writes messages at or above log_level to stderr.
 *
 * stdout is kept for per-file lines and the summary report.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Warning;
    bool use_colors = false;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (log_level == LogLevel::None || level < log_level) return;

        switch (level) {
            case LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << (use_colors ? YELLOW : "") << "[WARN ][" << tag << "] " << message
                          << (use_colors ? RESET : "") << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << (use_colors ? RED : "") << "[ERROR][" << tag << "] " << message
                          << (use_colors ? RESET : "") << std::endl;
                break;
            case LogLevel::None:
                break;
        }
    }
};

#endif // SHRINK_CONSOLE_LOG_SINK_HPP
