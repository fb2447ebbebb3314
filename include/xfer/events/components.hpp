/**
 * @file components.hpp
 * @brief Subscribers that turn transfer events into output
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ProgressComponent progress(bus);
 * // Engine progress forwarded onto the bus is now logged and rendered.
 */

#pragma once

#include "xfer/events/event_bus.hpp"
#include "xfer/events/events.hpp"
#include "xfer/transfer/buffer_sizer.hpp"
#include "xfer/transfer/metrics.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <iostream>
#include <ostream>

namespace xfer::events {

/**
 * @brief Logs transfer lifecycle events through spdlog
 *
 * Per-chunk events go to debug level; everything else to info, failures
 * to error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        started_id_ = bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_started(e);
        });

        chunk_id_ = bus_.subscribe<ChunkWrittenEvent>([this](const ChunkWrittenEvent& e) {
            on_chunk_written(e);
        });

        completed_id_ = bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_completed(e);
        });

        failed_id_ = bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_failed(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<TransferStartedEvent>(started_id_);
        bus_.unsubscribe<ChunkWrittenEvent>(chunk_id_);
        bus_.unsubscribe<TransferCompletedEvent>(completed_id_);
        bus_.unsubscribe<TransferFailedEvent>(failed_id_);
    }

    // Handlers capture this
    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] {} -> {} bytes={} write_size={} max_write_size={}",
                     e.source, e.destination, e.total_bytes, e.chunk_size, e.max_operation_size);
        if (e.chunk_size < e.requested_chunk_size) {
            spdlog::info("[TransferStarted] write size clamped from {} to {}",
                         transfer::format_size(static_cast<double>(e.requested_chunk_size)),
                         transfer::format_size(static_cast<double>(e.chunk_size)));
        }
    }

    void on_chunk_written(const ChunkWrittenEvent& e) {
        spdlog::debug("[ChunkWritten] op={} bytes={}/{}",
                      e.progress.operations, e.progress.bytes_so_far, e.progress.total_bytes);
    }

    void on_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] bytes={} ops={} elapsed={:.3f}s throughput={}/s",
                     e.result.total_bytes, e.result.operations, e.result.elapsed_seconds(),
                     transfer::format_size(e.result.throughput_bytes_per_sec));
    }

    void on_failed(const TransferFailedEvent& e) {
        spdlog::error("[TransferFailed] {} (confirmed before failure: bytes={} ops={})",
                      e.error.describe(), e.counters.bytes, e.counters.operations);
    }

    EventBus& bus_;
    EventBus::HandlerId started_id_ = 0;
    EventBus::HandlerId chunk_id_ = 0;
    EventBus::HandlerId completed_id_ = 0;
    EventBus::HandlerId failed_id_ = 0;
};

/**
 * @brief Renders a single-line console progress indicator
 *
 * WHAT IT DOES:
 * Rewrites one line ("\rProgress: ...") at most once per interval, and
 * always for the final chunk, then ends the line when the transfer
 * completes or fails. An interval of zero renders every chunk.
 */
class ProgressComponent {
public:
    explicit ProgressComponent(EventBus& bus,
                               std::ostream& out = std::cerr,
                               std::chrono::milliseconds interval = std::chrono::milliseconds{250})
        : bus_(bus), out_(out), interval_(interval) {
        started_id_ = bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            rendered_ = 0;
            line_open_ = false;
        });

        chunk_id_ = bus_.subscribe<ChunkWrittenEvent>([this](const ChunkWrittenEvent& e) {
            on_chunk_written(e);
        });

        completed_id_ = bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent&) {
            end_line();
        });

        failed_id_ = bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            end_line();
        });
    }

    ~ProgressComponent() {
        bus_.unsubscribe<TransferStartedEvent>(started_id_);
        bus_.unsubscribe<ChunkWrittenEvent>(chunk_id_);
        bus_.unsubscribe<TransferCompletedEvent>(completed_id_);
        bus_.unsubscribe<TransferFailedEvent>(failed_id_);
    }

    ProgressComponent(const ProgressComponent&) = delete;
    ProgressComponent& operator=(const ProgressComponent&) = delete;

    /// Number of progress lines written so far.
    std::size_t rendered() const { return rendered_; }

private:
    void on_chunk_written(const ChunkWrittenEvent& e) {
        const auto now = std::chrono::steady_clock::now();
        const bool last_chunk = e.progress.bytes_so_far >= e.progress.total_bytes;
        if (rendered_ > 0 && !last_chunk && now - last_render_ < interval_) {
            return;
        }

        out_ << fmt::format("\rProgress: {:.1f}% ({}/{} bytes) - Operations: {}",
                            e.progress.percent(),
                            transfer::group_thousands(e.progress.bytes_so_far),
                            transfer::group_thousands(e.progress.total_bytes),
                            transfer::group_thousands(e.progress.operations))
             << std::flush;
        last_render_ = now;
        line_open_ = true;
        ++rendered_;
    }

    void end_line() {
        if (line_open_) {
            out_ << '\n' << std::flush;
            line_open_ = false;
        }
    }

    EventBus& bus_;
    EventBus::HandlerId started_id_ = 0;
    EventBus::HandlerId chunk_id_ = 0;
    EventBus::HandlerId completed_id_ = 0;
    EventBus::HandlerId failed_id_ = 0;
    std::ostream& out_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_render_{};
    std::size_t rendered_ = 0;
    bool line_open_ = false;
};

} // namespace xfer::events
