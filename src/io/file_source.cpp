#include "xfer/io/file_source.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace xfer::io {
namespace fs = std::filesystem;

FileSource::FileSource(PrivateTag, fs::path path, std::uint64_t total_length)
    : path_(std::move(path)),
      input_(path_, std::ios::binary),
      total_length_(total_length) {}

Result<std::unique_ptr<FileSource>> FileSource::open(const fs::path& path) {
    using Ptr = std::unique_ptr<FileSource>;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<Ptr>(ErrorKind::Connection, "Source is not a regular file: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<Ptr>(ErrorKind::Connection,
                        "Failed to stat source file " + path.string() + ": " + ec.message());
    }

    auto source = std::make_unique<FileSource>(PrivateTag{}, path, static_cast<std::uint64_t>(size));
    if (!source->input_) {
        return Err<Ptr>(ErrorKind::Connection, "Failed to open source file: " + path.string());
    }

    spdlog::info("Source file {} size: {} bytes", path.string(), size);
    return Ok(std::move(source));
}

Result<std::vector<std::uint8_t>> FileSource::read(std::size_t max_bytes) {
    std::vector<std::uint8_t> buffer(max_bytes);
    if (max_bytes == 0) {
        return Ok(std::move(buffer));
    }

    input_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(max_bytes));
    const auto count = input_.gcount();
    if (input_.bad() || (input_.fail() && !input_.eof())) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::SourceRead,
                                              "Failed to read from " + path_.string());
    }

    buffer.resize(static_cast<std::size_t>(count));
    return Ok(std::move(buffer));
}

} // namespace xfer::io
