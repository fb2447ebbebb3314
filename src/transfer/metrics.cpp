#include "xfer/transfer/metrics.hpp"
#include "xfer/transfer/buffer_sizer.hpp"

#include <spdlog/fmt/fmt.h>

namespace xfer::transfer {

TransferResult derive_result(const TransferCounters& counters,
                             std::chrono::duration<double> elapsed,
                             std::size_t chunk_size) {
    TransferResult result;
    result.total_bytes = counters.bytes;
    result.operations = counters.operations;
    result.chunk_size = chunk_size;
    result.elapsed = elapsed;

    const double seconds = elapsed.count();
    const bool has_rate = seconds > 0.0 && counters.bytes > 0;

    if (counters.operations > 0) {
        result.avg_operation_size =
            static_cast<double>(counters.bytes) / static_cast<double>(counters.operations);
    }
    if (has_rate) {
        result.throughput_bytes_per_sec = static_cast<double>(counters.bytes) / seconds;
        result.operations_per_sec = static_cast<double>(counters.operations) / seconds;
    }
    return result;
}

std::string group_thousands(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3);

    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && i >= lead && (i - lead) % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(digits[i]);
    }
    return grouped;
}

std::vector<std::string> summary_lines(const TransferResult& result) {
    constexpr double kMiB = 1024.0 * 1024.0;

    return {
        "=== Transfer Complete ===",
        fmt::format("Write size: {} ({} bytes)", format_size(static_cast<double>(result.chunk_size)),
                    group_thousands(result.chunk_size)),
        fmt::format("Total time: {:.2f} seconds", result.elapsed_seconds()),
        fmt::format("Bytes written: {}", group_thousands(result.total_bytes)),
        fmt::format("Write operations: {}", group_thousands(result.operations)),
        fmt::format("Average write size: {:.1f} KB", result.avg_operation_size / 1024.0),
        fmt::format("Throughput: {:.2f} MB/s", result.throughput_bytes_per_sec / kMiB),
        fmt::format("Operations per second: {:.1f}", result.operations_per_sec),
    };
}

nlohmann::json to_json(const TransferResult& result) {
    nlohmann::json j;
    j["total_bytes"] = result.total_bytes;
    j["operations"] = result.operations;
    j["chunk_size"] = result.chunk_size;
    j["elapsed_seconds"] = result.elapsed_seconds();
    j["avg_operation_size"] = result.avg_operation_size;
    j["throughput_bytes_per_sec"] = result.throughput_bytes_per_sec;
    j["operations_per_sec"] = result.operations_per_sec;
    return j;
}

} // namespace xfer::transfer
