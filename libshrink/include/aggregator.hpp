/**
 * @file aggregator.hpp
 * @brief Running totals over FileRecords, by status and by extension.
 */

#ifndef SHRINK_AGGREGATOR_HPP
#define SHRINK_AGGREGATOR_HPP

#include "file_record.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace shrink {

struct ExtensionStats {
    std::string extension;          ///< Lower-cased, with the dot
    std::size_t count{};            ///< Files that reached byte-level processing
    std::uintmax_t bytes_before{};
    std::uintmax_t bytes_after{};
};

/**
 * @brief Immutable copy of the Aggregator state, read by the renderer.
 *
 * Invariants:
 * - total == compressed_count + skipped_backup_count + skipped_named_count
 *   + unreadable_count + error_count;
 * - the counts of all extensions sum to compressed_count + skipped_backup_count.
 */
struct AggregateSnapshot {
    using Clock = std::chrono::system_clock;

    std::size_t total{};
    std::size_t compressed_count{};
    std::size_t skipped_backup_count{};
    std::size_t skipped_named_count{};
    std::size_t unreadable_count{};
    std::size_t error_count{};
    std::uintmax_t bytes_before_total{};
    std::uintmax_t bytes_after_total{};
    double compressed_seconds_total{};     ///< Sum of elapsed_seconds over Compressed records
    std::vector<ExtensionStats> extensions;///< First-seen order
    std::vector<FileRecord> records;       ///< Enumeration order
    Clock::time_point start_time{};
    Clock::time_point end_time{};

    /// @return The stats for @p extension, or nullptr if none was recorded.
    [[nodiscard]] const ExtensionStats* find_extension(const std::string& extension) const;
};

/**
 * @brief Folds FileRecords into an AggregateSnapshot.
 *
 * All member functions are thread-safe. The batch driver still calls
 * update() from a single thread so the detail list keeps enumeration order.
 */
class Aggregator {
public:
    /**
     * @brief Count one record.
     *
     * Always increments the total and the counter of the record's status
     * and appends the record to the detail list. Byte totals and extension
     * stats only grow for Compressed and SkippedBackedUp records.
     */
    void update(FileRecord record);

    void mark_started(AggregateSnapshot::Clock::time_point when);
    void mark_finished(AggregateSnapshot::Clock::time_point when);

    /// Copy of the current state. Does not reset anything.
    [[nodiscard]] AggregateSnapshot snapshot() const;

private:
    mutable std::mutex mtx_;
    AggregateSnapshot state_;
    std::unordered_map<std::string, std::size_t> extension_index_; ///< extension -> index in state_.extensions
};

} // namespace shrink

#endif // SHRINK_AGGREGATOR_HPP
