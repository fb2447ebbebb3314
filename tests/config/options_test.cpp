#include "xfer/config/options.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace xfer;
using namespace xfer::config;

namespace {

fs::path write_config(const std::string& name, const std::string& content) {
    const fs::path path = fs::temp_directory_path() /
                          ("xfer_options_test_" + std::to_string(::getpid()) + "_" + name);
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(Options, Defaults) {
    auto options = parse_arguments(std::vector<std::string>{"--source", "zero:1MB", "--dest", "null:"});
    ASSERT_TRUE(options.is_ok());

    EXPECT_EQ(options.value().write_size, "64KB");
    EXPECT_EQ(options.value().max_write_size, "8MB");
    EXPECT_EQ(options.value().timeout_seconds, 30u);
    EXPECT_EQ(options.value().log_level, "info");
    EXPECT_TRUE(options.value().show_progress);
    EXPECT_FALSE(options.value().json_summary);

    auto resolved = resolve(options.value());
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value().chunk_size, 65536u);
    EXPECT_EQ(resolved.value().max_write_size, 8u * 1024 * 1024);
    EXPECT_EQ(resolved.value().object_store.timeout, std::chrono::seconds{30});
    EXPECT_EQ(resolved.value().log_level, spdlog::level::info);
    EXPECT_EQ(resolved.value().source.kind, io::SourceKind::Zero);
    EXPECT_EQ(resolved.value().sink.kind, io::SinkKind::Null);
    EXPECT_TRUE(resolved.value().object_store.endpoint.empty());
    EXPECT_TRUE(resolved.value().object_store.region.empty());
}

TEST(Options, FlagsOverrideDefaults) {
    auto options = parse_arguments(std::vector<std::string>{
        "--source", "s3://bucket/key", "--dest", "/mnt/share/out.bin", "--endpoint", "http://minio:9000/",
        "--region", "eu-west-1", "--write-size", "256KB", "--max-write-size", "1MB",
        "--timeout", "5",
        "--log-level", "debug", "--no-progress", "--json"});
    ASSERT_TRUE(options.is_ok()) << options.error().message;

    auto resolved = resolve(options.value());
    ASSERT_TRUE(resolved.is_ok()) << resolved.error().message;
    EXPECT_EQ(resolved.value().chunk_size, 262144u);
    EXPECT_EQ(resolved.value().max_write_size, 1048576u);
    EXPECT_EQ(resolved.value().object_store.timeout, std::chrono::seconds{5});
    EXPECT_EQ(resolved.value().log_level, spdlog::level::debug);
    EXPECT_FALSE(resolved.value().show_progress);
    EXPECT_TRUE(resolved.value().json_summary);
    EXPECT_EQ(resolved.value().object_store.endpoint, "http://minio:9000");
    EXPECT_EQ(resolved.value().object_store.region, "eu-west-1");
    EXPECT_EQ(resolved.value().source.bucket, "bucket");
    EXPECT_EQ(resolved.value().sink.path, "/mnt/share/out.bin");
}

TEST(Options, HelpStopsParsing) {
    auto options = parse_arguments(std::vector<std::string>{"--bogus", "--help"});
    ASSERT_TRUE(options.is_ok());
    EXPECT_TRUE(options.value().show_help);
}

TEST(Options, UnknownFlagIsConfigurationError) {
    auto options = parse_arguments(std::vector<std::string>{"--source", "zero:1", "--fast"});
    ASSERT_TRUE(options.is_error());
    EXPECT_EQ(options.error().kind, ErrorKind::Configuration);
}

TEST(Options, MissingValueIsConfigurationError) {
    auto options = parse_arguments(std::vector<std::string>{"--source"});
    ASSERT_TRUE(options.is_error());
    EXPECT_EQ(options.error().kind, ErrorKind::Configuration);
}

TEST(Options, InvalidTimeoutIsRejected) {
    EXPECT_TRUE(parse_arguments(std::vector<std::string>{"--timeout", "0"}).is_error());
    EXPECT_TRUE(parse_arguments(std::vector<std::string>{"--timeout", "-1"}).is_error());
    EXPECT_TRUE(parse_arguments(std::vector<std::string>{"--timeout", "soon"}).is_error());
}

TEST(Options, ResolveRejectsBadValues) {
    TransferOptions options;
    options.source_uri = "zero:1MB";
    options.dest_uri = "null:";

    auto bad_size = options;
    bad_size.write_size = "1.5MB";
    EXPECT_EQ(resolve(bad_size).error().kind, ErrorKind::Configuration);

    auto zero_max = options;
    zero_max.max_write_size = "0";
    EXPECT_TRUE(resolve(zero_max).is_error());

    auto bad_level = options;
    bad_level.log_level = "verbose";
    EXPECT_TRUE(resolve(bad_level).is_error());

    auto no_source = options;
    no_source.source_uri.clear();
    EXPECT_TRUE(resolve(no_source).is_error());

    auto bad_endpoint = options;
    bad_endpoint.endpoint = "ftp://minio";
    EXPECT_EQ(resolve(bad_endpoint).error().kind, ErrorKind::Configuration);

    auto huge_timeout = options;
    huge_timeout.timeout_seconds = kMaxTimeoutSeconds + 1;
    EXPECT_EQ(resolve(huge_timeout).error().kind, ErrorKind::Configuration);
}

TEST(Options, ObjectSourceUsesSdkDefaultsWithoutEndpoint) {
    TransferOptions options;
    options.source_uri = "s3://bucket/key";
    options.dest_uri = "null:";

    auto resolved = resolve(options);
    ASSERT_TRUE(resolved.is_ok()) << resolved.error().message;
    EXPECT_EQ(resolved.value().source.kind, io::SourceKind::Object);
    EXPECT_TRUE(resolved.value().object_store.endpoint.empty());
}

TEST(Options, ConfigFileIsMergedAndFlagsWin) {
    const auto path = write_config("merge.json", R"({
        "source": "zero:2MB",
        "dest": "null:",
        "write-size": "16KB",
        "max-write-size": 1048576,
        "timeout": 12,
        "log-level": "warn",
        "progress": false
    })");

    auto options = parse_arguments(std::vector<std::string>{"--write-size", "32KB", "--config", path.string()});
    ASSERT_TRUE(options.is_ok()) << options.error().message;

    EXPECT_EQ(options.value().source_uri, "zero:2MB");
    EXPECT_EQ(options.value().write_size, "32KB");
    EXPECT_EQ(options.value().max_write_size, "1048576");
    EXPECT_EQ(options.value().timeout_seconds, 12u);
    EXPECT_EQ(options.value().log_level, "warn");
    EXPECT_FALSE(options.value().show_progress);
    fs::remove(path);
}

TEST(Options, InvalidConfigFileIsConfigurationError) {
    const auto broken = write_config("broken.json", "{ not json");
    auto parsed = parse_arguments(std::vector<std::string>{"--config", broken.string()});
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::Configuration);
    fs::remove(broken);

    auto missing = parse_arguments(std::vector<std::string>{"--config", "/nonexistent/xfer.json"});
    EXPECT_TRUE(missing.is_error());
}

TEST(Options, ApplyConfigChecksKeysAndTypes) {
    TransferOptions options;

    EXPECT_TRUE(apply_config(nlohmann::json::array(), options).is_error());
    EXPECT_TRUE(apply_config(nlohmann::json{{"speed", "fast"}}, options).is_error());
    EXPECT_TRUE(apply_config(nlohmann::json{{"timeout", "30"}}, options).is_error());
    EXPECT_TRUE(apply_config(nlohmann::json{{"json", "yes"}}, options).is_error());

    ASSERT_TRUE(apply_config(nlohmann::json{{"json", true}, {"endpoint", "minio:9000"},
                                            {"region", "us-west-2"}},
                             options)
                    .is_ok());
    EXPECT_TRUE(options.json_summary);
    EXPECT_EQ(options.endpoint, "minio:9000");
    EXPECT_EQ(options.region, "us-west-2");
}

TEST(Options, ConfigTimeoutIsBounded) {
    TransferOptions options;
    options.source_uri = "zero:1MB";
    options.dest_uri = "null:";

    auto too_large = apply_config(nlohmann::json{{"timeout", 10000000000000000ull}}, options);
    ASSERT_TRUE(too_large.is_error());
    EXPECT_EQ(too_large.error().kind, ErrorKind::Configuration);
    EXPECT_TRUE(apply_config(nlohmann::json{{"timeout", 18446744073709551615ull}}, options).is_error());
    EXPECT_TRUE(apply_config(nlohmann::json{{"timeout", kMaxTimeoutSeconds + 1}}, options).is_error());
    EXPECT_EQ(options.timeout_seconds, 30u);

    ASSERT_TRUE(apply_config(nlohmann::json{{"timeout", kMaxTimeoutSeconds}}, options).is_ok());
    auto resolved = resolve(options);
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value().object_store.timeout, std::chrono::seconds{kMaxTimeoutSeconds});
    EXPECT_GT(resolved.value().object_store.timeout.count(), 0);
}

TEST(Options, UsageListsOptions) {
    const std::string text = usage("xfer");
    EXPECT_NE(text.find("--write-size"), std::string::npos);
    EXPECT_NE(text.find("--max-write-size"), std::string::npos);
    EXPECT_NE(text.find("s3://BUCKET/KEY"), std::string::npos);
    EXPECT_NE(text.find("--region"), std::string::npos);
}
