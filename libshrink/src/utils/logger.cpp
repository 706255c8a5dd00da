#include "../../include/logger.hpp"

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (level == LogLevel::None) return;
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}
