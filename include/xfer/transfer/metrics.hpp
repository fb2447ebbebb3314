#pragma once

#include "xfer/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace xfer::transfer {

/**
 * @brief Derive the final record from frozen counters
 *
 * Never fails: a zero elapsed time, zero bytes or zero operations yields
 * zero rates instead of a division error. Calling it twice on the same
 * inputs gives the same result.
 */
TransferResult derive_result(const TransferCounters& counters,
                             std::chrono::duration<double> elapsed,
                             std::size_t chunk_size);

/// Human-readable summary block, one entry per line.
std::vector<std::string> summary_lines(const TransferResult& result);

nlohmann::json to_json(const TransferResult& result);

/// 1073741824 -> "1,073,741,824"
std::string group_thousands(std::uint64_t value);

} // namespace xfer::transfer
