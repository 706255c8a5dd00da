#ifndef SHRINK_EVENTS_HPP
#define SHRINK_EVENTS_HPP

#include "file_record.hpp"
#include <cstddef>

namespace shrink {

/**
 * @brief Events published by BatchDriver on the EventBus.
 *
 * Plain data carriers. They are published from the thread that called
 * BatchDriver::run(), in enumeration order.
 */

/// Emitted once, before the first file is submitted.
struct BatchStartEvent {
    std::size_t total = 0; ///< Number of files to process
};

/// Emitted after a file has been processed and counted.
struct FileProcessedEvent {
    const FileRecord& record; ///< Valid only during the handler call
    std::size_t index = 0;    ///< 0-based position in the input list
    std::size_t total = 0;
};

/// Emitted at the end of a run that was stopped early.
struct BatchInterruptedEvent {
    std::size_t processed = 0; ///< Files counted in the snapshot
    std::size_t dropped = 0;   ///< Files never started
};

} // namespace shrink

#endif // SHRINK_EVENTS_HPP
