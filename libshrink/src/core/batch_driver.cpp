#include "../../include/batch_driver.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <chrono>
#include <future>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace shrink {

static_assert(std::atomic<bool>::is_always_lock_free);

BatchDriver::BatchDriver(const FileProcessor& processor, EventBus& bus, const unsigned threads)
    : processor_(processor),
      bus_(bus),
      pool_(threads) {}

AggregateSnapshot BatchDriver::run(const std::vector<fs::path>& files) {
    Aggregator aggregator;
    aggregator.mark_started(AggregateSnapshot::Clock::now());
    bus_.publish(BatchStartEvent{files.size()});
    Logger::log(LogLevel::Info,
                "Processing " + std::to_string(files.size()) + " files with " +
                std::to_string(pool_.size()) + " thread(s)",
                "BatchDriver");

    std::vector<std::future<std::optional<FileRecord>>> futures;
    futures.reserve(files.size());
    for (const auto& file : files) {
        if (stop_flag_.load(std::memory_order_relaxed)) break;
        try {
            futures.push_back(pool_.enqueue([this, file](const std::stop_token& st) -> std::optional<FileRecord> {
                if (st.stop_requested() || stop_flag_.load(std::memory_order_relaxed)) {
                    return std::nullopt;
                }
                return processor_.process(file);
            }));
        } catch (const std::runtime_error& e) {
            // the pool refuses work once a stop was requested
            Logger::log(LogLevel::Warning, std::string("Stopped submitting files: ") + e.what(), "BatchDriver");
            break;
        }
    }

    std::size_t dropped = files.size() - futures.size();
    bool pool_stopped = false;
    for (std::size_t i = 0; i < futures.size(); ++i) {
        if (!pool_stopped && stop_flag_.load(std::memory_order_relaxed)) {
            // the flag alone turns queued tasks into no-ops; this also clears the queue
            pool_.request_stop();
            pool_stopped = true;
        }
        std::optional<FileRecord> record;
        try {
            record = futures[i].get();
        } catch (const std::future_error&) {
            // task discarded by request_stop() before it started
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Worker failed on " + files[i].string() + ": " + e.what(), "BatchDriver");
            FileRecord failed;
            failed.path = files[i];
            failed.extension = lower_extension(files[i]);
            failed.status = Status::CompressionError;
            failed.errors.push_back({FailureKind::EncodeFailure, e.what()});
            record = std::move(failed);
        }

        if (!record) {
            ++dropped;
            continue;
        }
        std::string line = record->path.string() + ": " + std::string(to_string(record->status));
        for (const auto& failure : record->errors) {
            line += " [" + std::string(to_string(failure.kind)) + ": " + failure.detail + "]";
        }
        Logger::log(LogLevel::Debug, line, "BatchDriver");

        bus_.publish(FileProcessedEvent{*record, i, files.size()});
        aggregator.update(std::move(*record));
    }

    aggregator.mark_finished(AggregateSnapshot::Clock::now());
    auto snapshot = aggregator.snapshot();

    if (dropped > 0 || interrupted()) {
        Logger::log(LogLevel::Warning,
                    "Batch interrupted: " + std::to_string(snapshot.total) + " processed, " +
                    std::to_string(dropped) + " not started",
                    "BatchDriver");
        bus_.publish(BatchInterruptedEvent{snapshot.total, dropped});
    }
    return snapshot;
}

void BatchDriver::request_stop() noexcept {
    stop_flag_.store(true, std::memory_order_relaxed);
}

} // namespace shrink
