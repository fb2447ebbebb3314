#pragma once

#include "xfer/transfer/sink.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>

namespace xfer::io {

/**
 * @brief Destination file, typically on a mounted SMB/CIFS share
 *
 * open() creates or truncates the file (overwrite-if semantics). The stream
 * is unbuffered so every write() reaches the filesystem as one write of the
 * requested size. Buffers above max_operation_size are rejected.
 */
class FileSink : public transfer::Sink {
public:
    static constexpr std::size_t kDefaultMaxWriteSize = 8 * 1024 * 1024;

    explicit FileSink(std::filesystem::path path,
                      std::size_t max_operation_size = kDefaultMaxWriteSize);

    Result<void> open() override;
    Result<void> close() override;
    bool is_open() const override { return output_.is_open(); }

    std::size_t max_operation_size() const override { return max_operation_size_; }
    Result<std::size_t> write(const std::vector<std::uint8_t>& buffer) override;

    std::string describe() const override { return path_.string(); }

private:
    std::filesystem::path path_;
    std::size_t max_operation_size_;
    std::ofstream output_;
};

} // namespace xfer::io
