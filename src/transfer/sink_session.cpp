#include "xfer/transfer/sink.hpp"

#include <spdlog/spdlog.h>

namespace xfer::transfer {

SinkSession::~SinkSession() {
    if (!opened_) {
        return;
    }
    auto result = close();
    if (result.is_error()) {
        spdlog::error("Failed to close {}: {}", sink_.describe(), result.error().describe());
    }
}

Result<void> SinkSession::open() {
    if (opened_) {
        return Ok();
    }
    auto result = sink_.open();
    if (result.is_error()) {
        return result;
    }
    opened_ = true;
    spdlog::info("Opened {} (max write size {} bytes)", sink_.describe(), sink_.max_operation_size());
    return Ok();
}

Result<void> SinkSession::close() {
    if (!opened_) {
        return Ok();
    }
    opened_ = false;
    auto result = sink_.close();
    if (result.is_ok()) {
        spdlog::info("Closed {}", sink_.describe());
    }
    return result;
}

} // namespace xfer::transfer
