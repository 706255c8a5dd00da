#include "../../include/aggregator.hpp"

namespace shrink {

const ExtensionStats* AggregateSnapshot::find_extension(const std::string& extension) const {
    for (const auto& stats : extensions) {
        if (stats.extension == extension) return &stats;
    }
    return nullptr;
}

void Aggregator::update(FileRecord record) {
    std::lock_guard lock(mtx_);

    ++state_.total;
    bool byte_level = false;
    switch (record.status) {
        case Status::Compressed:
            ++state_.compressed_count;
            state_.compressed_seconds_total += record.elapsed_seconds;
            byte_level = true;
            break;
        case Status::SkippedBackedUp:
            ++state_.skipped_backup_count;
            byte_level = true;
            break;
        case Status::SkippedByName:
            ++state_.skipped_named_count;
            break;
        case Status::Unreadable:
            ++state_.unreadable_count;
            break;
        case Status::CompressionError:
            ++state_.error_count;
            break;
    }

    if (byte_level) {
        const std::uintmax_t after = record.size_after.value_or(record.size_before);
        state_.bytes_before_total += record.size_before;
        state_.bytes_after_total += after;

        auto [it, inserted] = extension_index_.try_emplace(record.extension, state_.extensions.size());
        if (inserted) {
            state_.extensions.push_back(ExtensionStats{record.extension, 0, 0, 0});
        }
        auto& stats = state_.extensions[it->second];
        ++stats.count;
        stats.bytes_before += record.size_before;
        stats.bytes_after += after;
    }

    state_.records.push_back(std::move(record));
}

void Aggregator::mark_started(const AggregateSnapshot::Clock::time_point when) {
    std::lock_guard lock(mtx_);
    state_.start_time = when;
}

void Aggregator::mark_finished(const AggregateSnapshot::Clock::time_point when) {
    std::lock_guard lock(mtx_);
    state_.end_time = when;
}

AggregateSnapshot Aggregator::snapshot() const {
    std::lock_guard lock(mtx_);
    return state_;
}

} // namespace shrink
