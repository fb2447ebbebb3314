#include "xfer/transfer/engine.hpp"
#include "xfer/transfer/buffer_sizer.hpp"
#include "xfer/transfer/metrics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace xfer::transfer {

template<typename T>
Result<T> TransferEngine::fail(Error error) {
    spdlog::debug("Transfer failed after {} operations ({} bytes): {}",
                  counters_.operations, counters_.bytes, error.describe());
    state_ = EngineState::Failed;
    last_error_ = error;
    return Err<T>(std::move(error));
}

Result<TransferResult> TransferEngine::run(Source& source,
                                           Sink& sink,
                                           std::size_t chunk_size,
                                           const ProgressCallback& progress) {
    if (auto started = start(source, sink, chunk_size); started.is_error()) {
        return started.forward_error<TransferResult>();
    }

    for (;;) {
        auto done = step(progress);
        if (done.is_error()) {
            return done.forward_error<TransferResult>();
        }
        if (done.value()) {
            break;
        }
    }

    return finish();
}

Result<void> TransferEngine::start(Source& source, Sink& sink, std::size_t chunk_size) {
    if (state_ != EngineState::Idle) {
        return Err<void>(ErrorKind::Configuration, "Transfer engine already started");
    }
    if (chunk_size == 0) {
        return Err<void>(ErrorKind::Configuration, "Chunk size must be greater than zero");
    }
    if (!sink.is_open()) {
        return Err<void>(ErrorKind::SinkWrite, "Sink " + sink.describe() + " is not open");
    }

    const std::size_t max_operation = sink.max_operation_size();
    if (max_operation == 0) {
        return Err<void>(ErrorKind::SinkWrite,
                         "Sink " + sink.describe() + " reported a zero maximum write size");
    }

    const std::size_t effective = clamp_chunk_size(chunk_size, max_operation);
    if (effective < chunk_size) {
        spdlog::warn("Requested write size {} exceeds sink maximum {}; using {}",
                     format_size(static_cast<double>(chunk_size)),
                     format_size(static_cast<double>(max_operation)),
                     format_size(static_cast<double>(effective)));
    }

    source_ = &source;
    sink_ = &sink;
    spec_ = TransferSpec{source.total_length(), effective};
    counters_ = TransferCounters{};
    last_error_.reset();

    started_at_ = std::chrono::steady_clock::now();
    last_write_at_ = started_at_;
    state_ = spec_.total_length == 0 ? EngineState::Completed : EngineState::Running;

    spdlog::debug("Transfer started: {} -> {}, {} bytes in chunks of {}",
                  source.describe(), sink.describe(), spec_.total_length, spec_.chunk_size);
    return Ok();
}

Result<bool> TransferEngine::step(const ProgressCallback& progress) {
    switch (state_) {
        case EngineState::Idle:
            return Err<bool>(ErrorKind::Configuration, "Transfer engine not started");
        case EngineState::Failed:
            return Err<bool>(*last_error_);
        case EngineState::Completed:
            return Ok(true);
        case EngineState::Running:
            break;
    }

    const std::uint64_t offset = counters_.bytes;
    const std::uint64_t remaining = spec_.total_length - offset;
    const auto want = static_cast<std::size_t>(
        std::min<std::uint64_t>(spec_.chunk_size, remaining));

    auto chunk = source_->read(want);
    if (chunk.is_error()) {
        return fail<bool>(chunk.error());
    }
    const auto& buffer = chunk.value();
    if (buffer.size() != want) {
        return fail<bool>(Error::source_read(
            "Premature end of stream from " + source_->describe() + " at offset " +
            std::to_string(offset) + ": requested " + std::to_string(want) +
            " bytes, received " + std::to_string(buffer.size())));
    }

    auto written = sink_->write(buffer);
    if (written.is_error()) {
        return fail<bool>(written.error());
    }
    if (written.value() < want) {
        return fail<bool>(Error::short_write(
            "Short write to " + sink_->describe() + " at offset " + std::to_string(offset) +
            ": " + std::to_string(written.value()) + " of " + std::to_string(want) +
            " bytes persisted"));
    }
    if (written.value() > want) {
        return fail<bool>(Error::sink_write(
            "Sink " + sink_->describe() + " reported " + std::to_string(written.value()) +
            " bytes written for a " + std::to_string(want) + " byte buffer"));
    }

    counters_.bytes += written.value();
    ++counters_.operations;
    last_write_at_ = std::chrono::steady_clock::now();

    if (progress) {
        progress(ProgressEvent{counters_.bytes, spec_.total_length, counters_.operations});
    }

    if (counters_.bytes == spec_.total_length) {
        state_ = EngineState::Completed;
        return Ok(true);
    }
    return Ok(false);
}

Result<TransferResult> TransferEngine::finish() const {
    if (state_ == EngineState::Failed) {
        return Err<TransferResult>(*last_error_);
    }
    if (state_ != EngineState::Completed) {
        return Err<TransferResult>(ErrorKind::Configuration, "Transfer has not completed");
    }
    return Ok(derive_result(counters_, elapsed(), spec_.chunk_size));
}

} // namespace xfer::transfer
