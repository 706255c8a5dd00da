/**
 * @file batch_driver.hpp
 * @brief Runs the FileProcessor over a list of files and aggregates results.
 */

#ifndef SHRINK_BATCH_DRIVER_HPP
#define SHRINK_BATCH_DRIVER_HPP

#include "aggregator.hpp"
#include "event_bus.hpp"
#include "file_processor.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <filesystem>
#include <vector>

namespace shrink {

/**
 * @brief Orchestrates one batch.
 *
 * @details Files are processed by a ThreadPool (one thread gives
 * sequential processing). Results are folded into an Aggregator on the
 * calling thread, in input order, and announced on the EventBus as
 * FileProcessedEvent. A failing file never stops the batch.
 *
 * request_stop() can be called from another thread or a signal handler;
 * it only sets a lock-free flag. Files not yet started are dropped, files
 * in flight finish, and run() returns a snapshot of what completed.
 */
class BatchDriver {
public:
    /**
     * @param processor Shared by all workers; must outlive the driver.
     * @param bus Receives progress events.
     * @param threads Worker count (0 is treated as 1).
     */
    BatchDriver(const FileProcessor& processor, EventBus& bus, unsigned threads);

    /**
     * @brief Process @p files and return the aggregated outcome.
     *
     * start_time is taken before the first file is submitted, end_time
     * after the last result is counted.
     */
    AggregateSnapshot run(const std::vector<std::filesystem::path>& files);

    /// Async-signal-safe.
    void request_stop() noexcept;

    [[nodiscard]] bool interrupted() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

private:
    const FileProcessor& processor_;
    EventBus& bus_;
    std::atomic<bool> stop_flag_{false}; ///< Read by queued tasks, so it must outlive pool_
    ThreadPool pool_;
};

} // namespace shrink

#endif // SHRINK_BATCH_DRIVER_HPP
