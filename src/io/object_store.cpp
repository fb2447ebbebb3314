#include "xfer/io/object_store.hpp"

#include <spdlog/spdlog.h>

namespace xfer::io {
namespace {

constexpr const char* kAllocationTag = "xfer";

bool valid_port(const std::string& text) {
    if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    const unsigned long port = std::stoul(text);
    return port > 0 && port <= 65535;
}

} // namespace

Result<std::string> parse_endpoint(const std::string& text) {
    std::string scheme;
    std::string authority = text;

    const auto separator = text.find("://");
    if (separator != std::string::npos) {
        scheme = text.substr(0, separator);
        if (scheme != "http" && scheme != "https") {
            return Err<std::string>(ErrorKind::Configuration,
                                    "Endpoint scheme must be http or https: " + text);
        }
        authority = text.substr(separator + 3);
    }
    if (!authority.empty() && authority.back() == '/') {
        authority.pop_back();
    }

    if (authority.empty() || authority.find_first_of(" \t\r\n/?#@") != std::string::npos) {
        return Err<std::string>(ErrorKind::Configuration,
                                "Endpoint must look like [http[s]://]host[:port]: " + text);
    }
    const auto colon = authority.find(':');
    if (colon != std::string::npos &&
        (colon == 0 || !valid_port(authority.substr(colon + 1)))) {
        return Err<std::string>(ErrorKind::Configuration, "Invalid endpoint port: " + text);
    }

    return Ok(scheme.empty() ? authority : scheme + "://" + authority);
}

std::shared_ptr<Aws::S3::S3Client> make_s3_client(const ObjectStoreSettings& settings) {
    Aws::S3::S3ClientConfiguration config;
    if (!settings.endpoint.empty()) {
        config.endpointOverride = settings.endpoint;
        // S3-compatible servers rarely resolve bucket subdomains
        config.useVirtualAddressing = false;
    }
    if (!settings.region.empty()) {
        config.region = settings.region;
    }
    config.connectTimeoutMs = static_cast<long>(settings.timeout.count());
    config.requestTimeoutMs = static_cast<long>(settings.timeout.count());

    spdlog::debug("S3 client: endpoint={} region={} timeout={}ms",
                  settings.endpoint.empty() ? "<default>" : settings.endpoint,
                  config.region.c_str(), settings.timeout.count());
    return Aws::MakeShared<Aws::S3::S3Client>(kAllocationTag, config);
}

AwsSdkScope::AwsSdkScope() {
    Aws::InitAPI(options_);
}

AwsSdkScope::~AwsSdkScope() {
    Aws::ShutdownAPI(options_);
}

} // namespace xfer::io
