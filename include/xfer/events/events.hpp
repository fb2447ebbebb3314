/**
 * @file events.hpp
 * @brief Events published during one transfer
 *
 * NAMING CONVENTION:
 * Events are past-tense: TransferStartedEvent, ChunkWrittenEvent
 */

#pragma once

#include "xfer/core/error.hpp"
#include "xfer/transfer/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace xfer::events {

/**
 * @brief Emitted once the sink is open and the chunk size is fixed
 *
 * WHO EMITS: command-line driver, after TransferEngine::start()
 * WHO SUBSCRIBES: LoggerComponent, ProgressComponent
 */
struct TransferStartedEvent {
    std::string source;
    std::string destination;
    std::uint64_t total_bytes = 0;
    std::size_t requested_chunk_size = 0;
    std::size_t chunk_size = 0;            ///< after clamping to the sink maximum
    std::size_t max_operation_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after every successful write operation
 */
struct ChunkWrittenEvent {
    transfer::ProgressEvent progress;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferCompletedEvent {
    transfer::TransferResult result;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the transfer aborts
 *
 * counters holds what was confirmed before the failing operation.
 */
struct TransferFailedEvent {
    Error error;
    transfer::TransferCounters counters;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace xfer::events
