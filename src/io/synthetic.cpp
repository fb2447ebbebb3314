#include "xfer/io/synthetic.hpp"

#include <algorithm>

namespace xfer::io {
namespace {

Result<std::size_t> check_write(const transfer::Sink& sink, std::size_t size) {
    if (!sink.is_open()) {
        return Err<std::size_t>(ErrorKind::SinkWrite, sink.describe() + " sink is not open");
    }
    if (size > sink.max_operation_size()) {
        return Err<std::size_t>(ErrorKind::SinkWrite,
                                "Write of " + std::to_string(size) +
                                    " bytes exceeds maximum write size " +
                                    std::to_string(sink.max_operation_size()));
    }
    return Ok(size);
}

} // namespace

Result<MemorySource::Data> MemorySource::read(std::size_t max_bytes) {
    const std::size_t count = std::min(max_bytes, data_.size() - position_);
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(position_);
    Data chunk(first, first + static_cast<std::ptrdiff_t>(count));
    position_ += count;
    return Ok(std::move(chunk));
}

Result<std::vector<std::uint8_t>> ZeroSource::read(std::size_t max_bytes) {
    const auto count = static_cast<std::size_t>(
        std::min<std::uint64_t>(max_bytes, length_ - produced_));
    produced_ += count;
    return Ok(std::vector<std::uint8_t>(count, 0));
}

Result<void> NullSink::open() {
    open_ = true;
    return Ok();
}

Result<void> NullSink::close() {
    open_ = false;
    return Ok();
}

Result<std::size_t> NullSink::write(const std::vector<std::uint8_t>& buffer) {
    auto checked = check_write(*this, buffer.size());
    if (checked.is_ok()) {
        discarded_ += buffer.size();
    }
    return checked;
}

Result<void> MemorySink::open() {
    open_ = true;
    ++open_count_;
    return Ok();
}

Result<void> MemorySink::close() {
    open_ = false;
    ++close_count_;
    return Ok();
}

Result<std::size_t> MemorySink::write(const Data& buffer) {
    auto checked = check_write(*this, buffer.size());
    if (checked.is_ok()) {
        data_.insert(data_.end(), buffer.begin(), buffer.end());
        write_sizes_.push_back(buffer.size());
    }
    return checked;
}

} // namespace xfer::io
