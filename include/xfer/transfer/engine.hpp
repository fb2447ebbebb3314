#pragma once

#include "xfer/core/result.hpp"
#include "xfer/transfer/sink.hpp"
#include "xfer/transfer/source.hpp"
#include "xfer/transfer/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace xfer::transfer {

/**
 * @brief Linear, single-stream copy from a Source to an open Sink
 *
 * One engine instance drives one transfer. run() performs the whole copy;
 * start()/step()/finish() expose the same loop one operation at a time so
 * a caller can stop after any chunk. Errors propagate immediately and the
 * counters accumulated before the failing operation stay readable through
 * counters().
 *
 * EXAMPLE:
 * TransferEngine engine;
 * auto result = engine.run(source, sink, 64 * 1024, [](const ProgressEvent& p) {
 *     spdlog::debug("{}/{}", p.bytes_so_far, p.total_bytes);
 * });
 */
class TransferEngine {
public:
    TransferEngine() = default;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    Result<TransferResult> run(Source& source,
                               Sink& sink,
                               std::size_t chunk_size,
                               const ProgressCallback& progress = {});

    /**
     * @brief Validate inputs and fix the effective chunk size
     *
     * The requested size is clamped to sink.max_operation_size(); the sink
     * must already be open.
     */
    Result<void> start(Source& source, Sink& sink, std::size_t chunk_size);

    /**
     * @brief Perform one read-then-write operation
     *
     * @return true once every byte has been written
     */
    Result<bool> step(const ProgressCallback& progress = {});

    /// Build the final record; only valid after the last step succeeded.
    Result<TransferResult> finish() const;

    [[nodiscard]] const TransferCounters& counters() const noexcept { return counters_; }
    [[nodiscard]] const TransferSpec& spec() const noexcept { return spec_; }
    [[nodiscard]] EngineState state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return last_error_; }

    /// Time between the start of the first read and the end of the last write.
    [[nodiscard]] std::chrono::duration<double> elapsed() const noexcept {
        return last_write_at_ - started_at_;
    }

private:
    template<typename T>
    Result<T> fail(Error error);

    Source* source_ = nullptr;
    Sink* sink_ = nullptr;

    TransferSpec spec_;
    TransferCounters counters_;
    EngineState state_ = EngineState::Idle;
    std::optional<Error> last_error_;

    std::chrono::steady_clock::time_point started_at_{};
    std::chrono::steady_clock::time_point last_write_at_{};
};

} // namespace xfer::transfer
