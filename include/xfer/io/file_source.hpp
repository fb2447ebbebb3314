#pragma once

#include "xfer/core/result.hpp"
#include "xfer/transfer/source.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

namespace xfer::io {

/**
 * @brief Local (or locally mounted) file read front to back
 */
class FileSource : public transfer::Source {
    // Only open() can name the tag
    struct PrivateTag {};

public:
    static Result<std::unique_ptr<FileSource>> open(const std::filesystem::path& path);

    FileSource(PrivateTag, std::filesystem::path path, std::uint64_t total_length);

    std::uint64_t total_length() const override { return total_length_; }
    Result<std::vector<std::uint8_t>> read(std::size_t max_bytes) override;
    std::string describe() const override { return path_.string(); }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t total_length_ = 0;
};

} // namespace xfer::io
