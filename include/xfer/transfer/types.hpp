#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace xfer::transfer {

enum class EngineState {
    Idle,
    Running,
    Completed,
    Failed
};

/**
 * @brief Fixed parameters of one transfer
 *
 * chunk_size is the effective size after clamping against the sink's
 * maximum operation size.
 */
struct TransferSpec {
    std::uint64_t total_length = 0;
    std::size_t chunk_size = 0;
};

/**
 * @brief Running totals owned by the engine
 *
 * operations grows by exactly one per successful write call.
 */
struct TransferCounters {
    std::uint64_t bytes = 0;
    std::uint64_t operations = 0;
};

/**
 * @brief Snapshot handed to the progress callback after each write
 */
struct ProgressEvent {
    std::uint64_t bytes_so_far = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t operations = 0;

    double percent() const {
        if (total_bytes == 0) {
            return 100.0;
        }
        return static_cast<double>(bytes_so_far) * 100.0 / static_cast<double>(total_bytes);
    }
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Final record of a completed transfer
 */
struct TransferResult {
    std::uint64_t total_bytes = 0;
    std::uint64_t operations = 0;
    std::size_t chunk_size = 0;
    std::chrono::duration<double> elapsed{0.0};
    double avg_operation_size = 0.0;        ///< bytes per write
    double throughput_bytes_per_sec = 0.0;
    double operations_per_sec = 0.0;

    double elapsed_seconds() const { return elapsed.count(); }
};

} // namespace xfer::transfer
