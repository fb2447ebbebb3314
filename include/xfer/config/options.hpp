#pragma once

#include "xfer/core/result.hpp"
#include "xfer/io/locations.hpp"
#include "xfer/io/object_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace xfer::config {

/// Largest accepted timeout, from the command line or a config file.
constexpr unsigned long kMaxTimeoutSeconds = 999999999;

/**
 * @brief Raw option values as given on the command line or in a config file
 *
 * Sizes and URIs stay textual here; resolve() validates them.
 */
struct TransferOptions {
    std::string source_uri;
    std::string dest_uri;
    std::string endpoint;
    std::string region;
    std::string config_path;
    std::string write_size = "64KB";
    std::string max_write_size = "8MB";
    unsigned long timeout_seconds = 30;
    std::string log_level = "info";
    bool show_progress = true;
    bool json_summary = false;
    bool show_help = false;
};

/**
 * @brief Validated settings the executable runs with
 */
struct ResolvedOptions {
    io::SourceLocation source;
    io::SinkLocation sink;
    io::ObjectStoreSettings object_store;
    std::size_t chunk_size = 0;
    std::size_t max_write_size = 0;
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool show_progress = true;
    bool json_summary = false;
};

/**
 * @brief Build options from command-line arguments (program name excluded)
 *
 * --config FILE is loaded first wherever it appears, so every other flag
 * overrides the file. --help stops parsing and sets show_help.
 */
Result<TransferOptions> parse_arguments(const std::vector<std::string>& args);
Result<TransferOptions> parse_arguments(int argc, char* argv[]);

/// Merge a JSON object whose keys are the long option names without "--".
Result<void> apply_config(const nlohmann::json& document, TransferOptions& options);
Result<void> load_config_file(const std::filesystem::path& path, TransferOptions& options);

/// Validate sizes, URIs, endpoint and log level before any I/O happens.
Result<ResolvedOptions> resolve(const TransferOptions& options);

std::string usage(const std::string& program);

} // namespace xfer::config
