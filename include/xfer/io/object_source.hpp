#pragma once

#include "xfer/core/result.hpp"
#include "xfer/transfer/source.hpp"

#include <aws/s3/S3Client.h>

#include <cstdint>
#include <memory>
#include <string>

namespace xfer::io {

/**
 * @brief Object-store object read through S3 range requests
 *
 * open() issues HeadObject and takes ContentLength as the total length.
 * Each read(n) is one GetObject with Range "bytes=<offset>-<offset+n-1>".
 * The client is shared so callers (and tests) decide how it is built.
 */
class ObjectSource : public transfer::Source {
    struct PrivateTag {};

public:
    static Result<std::unique_ptr<ObjectSource>> open(std::shared_ptr<Aws::S3::S3Client> client,
                                                      std::string bucket,
                                                      std::string key);

    ObjectSource(PrivateTag, std::shared_ptr<Aws::S3::S3Client> client, std::string bucket,
                 std::string key);

    std::uint64_t total_length() const override { return total_length_; }
    Result<std::vector<std::uint8_t>> read(std::size_t max_bytes) override;
    std::string describe() const override;

    std::uint64_t offset() const noexcept { return offset_; }

    /// Inclusive HTTP byte range, e.g. byte_range(0, 4095) == "bytes=0-4095".
    static std::string byte_range(std::uint64_t first, std::uint64_t last);

private:
    std::shared_ptr<Aws::S3::S3Client> client_;
    std::string bucket_;
    std::string key_;
    std::uint64_t total_length_ = 0;
    std::uint64_t offset_ = 0;
};

} // namespace xfer::io
