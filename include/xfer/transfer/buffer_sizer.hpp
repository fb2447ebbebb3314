#pragma once

#include "xfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace xfer::transfer {

constexpr std::size_t kDefaultChunkSize = 64 * 1024;

/**
 * @brief Parse a size such as "131072", "64KB" or "1mb" into bytes
 *
 * Units are KB and MB (case-insensitive, base 1024); no unit means bytes.
 * Whitespace around the value and between number and unit is ignored.
 * Zero is accepted here; use parse_chunk_size for write sizes.
 */
Result<std::uint64_t> parse_size(const std::string& spec);

/// Like parse_size, but a size that resolves to zero is a configuration error.
Result<std::size_t> parse_chunk_size(const std::string& spec);

/// Smaller of the requested size and the sink's maximum single write.
std::size_t clamp_chunk_size(std::size_t requested, std::size_t max_operation_size);

/// Binary-prefixed rendering, e.g. "512 B", "64.00 KiB", "1.50 GiB".
std::string format_size(double bytes);

} // namespace xfer::transfer
