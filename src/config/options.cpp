#include "xfer/config/options.hpp"
#include "xfer/transfer/buffer_sizer.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <sstream>

namespace xfer::config {
namespace {

using json = nlohmann::json;

constexpr std::array<const char*, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

Result<unsigned long> parse_timeout(const std::string& text) {
    if (text.empty() || text.size() > 9 || text.find_first_not_of("0123456789") != std::string::npos) {
        return Err<unsigned long>(ErrorKind::Configuration,
                                  "Timeout must be a positive number of seconds: " + text);
    }
    const unsigned long seconds = std::stoul(text);
    if (seconds == 0) {
        return Err<unsigned long>(ErrorKind::Configuration, "Timeout must be greater than zero");
    }
    return Ok(seconds);
}

Result<void> check_timeout(unsigned long seconds) {
    if (seconds == 0 || seconds > kMaxTimeoutSeconds) {
        return Err<void>(ErrorKind::Configuration,
                         fmt::format("Timeout must be between 1 and {} seconds", kMaxTimeoutSeconds));
    }
    return Ok();
}

Result<void> expect_string(const json& document, const char* key, std::string& target) {
    const auto& value = document.at(key);
    if (!value.is_string()) {
        return Err<void>(ErrorKind::Configuration,
                         std::string("Config key '") + key + "' must be a string");
    }
    target = value.get<std::string>();
    return Ok();
}

Result<void> expect_bool(const json& document, const char* key, bool& target) {
    const auto& value = document.at(key);
    if (!value.is_boolean()) {
        return Err<void>(ErrorKind::Configuration,
                         std::string("Config key '") + key + "' must be true or false");
    }
    target = value.get<bool>();
    return Ok();
}

} // namespace

Result<void> apply_config(const json& document, TransferOptions& options) {
    if (!document.is_object()) {
        return Err<void>(ErrorKind::Configuration, "Config file must contain a JSON object");
    }

    for (auto it = document.begin(); it != document.end(); ++it) {
        const std::string& key = it.key();
        Result<void> applied = Ok();

        if (key == "source") {
            applied = expect_string(document, "source", options.source_uri);
        } else if (key == "dest") {
            applied = expect_string(document, "dest", options.dest_uri);
        } else if (key == "endpoint") {
            applied = expect_string(document, "endpoint", options.endpoint);
        } else if (key == "write-size") {
            // Plain byte counts may be given as numbers
            if (it.value().is_number_unsigned()) {
                options.write_size = std::to_string(it.value().get<std::uint64_t>());
            } else {
                applied = expect_string(document, "write-size", options.write_size);
            }
        } else if (key == "max-write-size") {
            if (it.value().is_number_unsigned()) {
                options.max_write_size = std::to_string(it.value().get<std::uint64_t>());
            } else {
                applied = expect_string(document, "max-write-size", options.max_write_size);
            }
        } else if (key == "region") {
            applied = expect_string(document, "region", options.region);
        } else if (key == "timeout") {
            if (!it.value().is_number_unsigned() || it.value().get<std::uint64_t>() == 0) {
                applied = Err<void>(ErrorKind::Configuration,
                                    "Config key 'timeout' must be a positive integer");
            } else if (it.value().get<std::uint64_t>() > kMaxTimeoutSeconds) {
                applied = Err<void>(ErrorKind::Configuration,
                                    fmt::format("Config key 'timeout' must not exceed {} seconds",
                                                kMaxTimeoutSeconds));
            } else {
                options.timeout_seconds = static_cast<unsigned long>(it.value().get<std::uint64_t>());
            }
        } else if (key == "log-level") {
            applied = expect_string(document, "log-level", options.log_level);
        } else if (key == "progress") {
            applied = expect_bool(document, "progress", options.show_progress);
        } else if (key == "json") {
            applied = expect_bool(document, "json", options.json_summary);
        } else {
            applied = Err<void>(ErrorKind::Configuration, "Unknown config key: " + key);
        }

        if (applied.is_error()) {
            return applied;
        }
    }
    return Ok();
}

Result<void> load_config_file(const std::filesystem::path& path, TransferOptions& options) {
    std::ifstream input(path);
    if (!input) {
        return Err<void>(ErrorKind::Configuration, "Cannot open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return Err<void>(ErrorKind::Configuration, "Config file is not valid JSON: " + path.string());
    }

    spdlog::debug("Loaded config file {}", path.string());
    return apply_config(document, options);
}

Result<TransferOptions> parse_arguments(const std::vector<std::string>& args) {
    TransferOptions options;

    // First pass: --help wins outright, --config is applied before other flags
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-h" || args[i] == "--help") {
            options.show_help = true;
            return Ok(std::move(options));
        }
        if (args[i] == "--config" && i + 1 < args.size()) {
            options.config_path = args[++i];
        }
    }
    if (!options.config_path.empty()) {
        if (auto loaded = load_config_file(options.config_path, options); loaded.is_error()) {
            return loaded.forward_error<TransferOptions>();
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--no-progress") {
            options.show_progress = false;
            continue;
        }
        if (arg == "--json") {
            options.json_summary = true;
            continue;
        }

        const bool takes_value = arg == "--source" || arg == "--dest" || arg == "--endpoint" ||
                                 arg == "--region" || arg == "--write-size" ||
                                 arg == "--max-write-size" || arg == "--timeout" ||
                                 arg == "--log-level" || arg == "--config";
        if (!takes_value) {
            return Err<TransferOptions>(ErrorKind::Configuration, "Unknown argument: " + arg);
        }
        if (!has_value) {
            return Err<TransferOptions>(ErrorKind::Configuration, "Missing value for " + arg);
        }

        const std::string& value = args[++i];
        if (arg == "--source") {
            options.source_uri = value;
        } else if (arg == "--dest") {
            options.dest_uri = value;
        } else if (arg == "--endpoint") {
            options.endpoint = value;
        } else if (arg == "--region") {
            options.region = value;
        } else if (arg == "--write-size") {
            options.write_size = value;
        } else if (arg == "--max-write-size") {
            options.max_write_size = value;
        } else if (arg == "--timeout") {
            auto seconds = parse_timeout(value);
            if (seconds.is_error()) {
                return seconds.forward_error<TransferOptions>();
            }
            options.timeout_seconds = seconds.value();
        } else if (arg == "--log-level") {
            options.log_level = value;
        }
    }

    return Ok(std::move(options));
}

Result<TransferOptions> parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_arguments(args);
}

Result<ResolvedOptions> resolve(const TransferOptions& options) {
    ResolvedOptions resolved;

    auto chunk = transfer::parse_chunk_size(options.write_size);
    if (chunk.is_error()) {
        return Err<ResolvedOptions>(ErrorKind::Configuration,
                                    "Invalid --write-size: " + chunk.error().message);
    }
    resolved.chunk_size = chunk.value();

    auto max_write = transfer::parse_chunk_size(options.max_write_size);
    if (max_write.is_error()) {
        return Err<ResolvedOptions>(ErrorKind::Configuration,
                                    "Invalid --max-write-size: " + max_write.error().message);
    }
    resolved.max_write_size = max_write.value();

    auto source = io::parse_source_uri(options.source_uri);
    if (source.is_error()) {
        return source.forward_error<ResolvedOptions>();
    }
    resolved.source = std::move(source.value());

    auto sink = io::parse_sink_uri(options.dest_uri);
    if (sink.is_error()) {
        return sink.forward_error<ResolvedOptions>();
    }
    resolved.sink = std::move(sink.value());

    if (!options.endpoint.empty()) {
        auto endpoint = io::parse_endpoint(options.endpoint);
        if (endpoint.is_error()) {
            return endpoint.forward_error<ResolvedOptions>();
        }
        resolved.object_store.endpoint = std::move(endpoint.value());
    }
    resolved.object_store.region = options.region;

    // Struct fields can be set directly, so the bound is checked again here
    if (auto timeout = check_timeout(options.timeout_seconds); timeout.is_error()) {
        return timeout.forward_error<ResolvedOptions>();
    }
    resolved.object_store.timeout = std::chrono::seconds(options.timeout_seconds);

    bool known_level = false;
    for (const char* name : kLogLevels) {
        known_level = known_level || options.log_level == name;
    }
    if (!known_level) {
        return Err<ResolvedOptions>(ErrorKind::Configuration,
                                    "Unknown log level: " + options.log_level);
    }
    resolved.log_level = spdlog::level::from_str(options.log_level);

    resolved.show_progress = options.show_progress;
    resolved.json_summary = options.json_summary;
    return Ok(std::move(resolved));
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " --source URI --dest URI [options]\n"
        << "\n"
        << "Sources:\n"
        << "  s3://BUCKET/KEY          object read with S3 range requests\n"
        << "  file:///PATH | PATH      local or mounted file\n"
        << "  zero:SIZE                zero-filled stream, e.g. zero:1024MB\n"
        << "\n"
        << "Destinations:\n"
        << "  file:///PATH | PATH      file on a mounted share (created or overwritten)\n"
        << "  null:                    discard everything\n"
        << "\n"
        << "Options:\n"
        << "  --endpoint URL           S3-compatible endpoint, e.g. http://minio:9000\n"
        << "  --region REGION          object store region (default from the AWS profile)\n"
        << "  --write-size SIZE        bytes per write operation (default 64KB)\n"
        << "  --max-write-size SIZE    destination's maximum single write (default 8MB)\n"
        << "  --timeout SECONDS        network timeout (default 30)\n"
        << "  --config FILE            JSON file with the options above\n"
        << "  --log-level LEVEL        trace, debug, info, warn, error, critical, off\n"
        << "  --no-progress            do not print the progress line\n"
        << "  --json                   print the summary as JSON as well\n"
        << "  -h, --help               show this text\n"
        << "\n"
        << "Object store credentials come from the standard AWS environment variables,\n"
        << "shared profile files or instance role.\n"
        << "\n"
        << "SIZE is a byte count with an optional KB or MB suffix, e.g. 16KB, 256KB, 1MB.\n";
    return oss.str();
}

} // namespace xfer::config
