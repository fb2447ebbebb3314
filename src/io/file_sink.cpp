#include "xfer/io/file_sink.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

namespace xfer::io {
namespace fs = std::filesystem;

FileSink::FileSink(fs::path path, std::size_t max_operation_size)
    : path_(std::move(path)), max_operation_size_(max_operation_size) {}

Result<void> FileSink::open() {
    if (output_.is_open()) {
        return Err<void>(ErrorKind::Connection, "Destination already open: " + path_.string());
    }

    // Must be set before open() to take effect
    output_.rdbuf()->pubsetbuf(nullptr, 0);
    output_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!output_) {
        const std::string reason = std::strerror(errno);
        output_.clear();
        return Err<void>(ErrorKind::Connection,
                         "Failed to open destination " + path_.string() + ": " + reason);
    }
    return Ok();
}

Result<void> FileSink::close() {
    if (!output_.is_open()) {
        return Ok();
    }
    output_.close();
    if (!output_) {
        output_.clear();
        return Err<void>(ErrorKind::SinkWrite, "Failed to close destination " + path_.string());
    }
    return Ok();
}

Result<std::size_t> FileSink::write(const std::vector<std::uint8_t>& buffer) {
    if (!output_.is_open()) {
        return Err<std::size_t>(ErrorKind::SinkWrite, "Destination not open: " + path_.string());
    }
    if (buffer.size() > max_operation_size_) {
        return Err<std::size_t>(ErrorKind::SinkWrite,
                                "Write of " + std::to_string(buffer.size()) +
                                    " bytes exceeds maximum write size " +
                                    std::to_string(max_operation_size_));
    }

    output_.write(reinterpret_cast<const char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
    if (!output_) {
        const std::string reason = std::strerror(errno);
        return Err<std::size_t>(ErrorKind::SinkWrite,
                                "Failed to write to " + path_.string() + ": " + reason);
    }
    return Ok(buffer.size());
}

} // namespace xfer::io
