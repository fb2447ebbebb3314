#pragma once

#include "xfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xfer::transfer {

/**
 * @brief Sequential byte producer with a known total length
 *
 * read(n) returns at most n bytes and returns fewer only at end of stream.
 * Transport failures are reported as ErrorKind::SourceRead.
 */
class Source {
public:
    virtual ~Source() = default;

    virtual std::uint64_t total_length() const = 0;
    virtual Result<std::vector<std::uint8_t>> read(std::size_t max_bytes) = 0;

    /// Short human-readable location, used in log lines.
    virtual std::string describe() const = 0;
};

} // namespace xfer::transfer
