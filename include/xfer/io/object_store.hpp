#pragma once

#include "xfer/core/result.hpp"

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

#include <chrono>
#include <memory>
#include <string>

namespace xfer::io {

/**
 * @brief How to reach the object store
 *
 * Empty fields leave the SDK defaults in place: the region then comes from
 * AWS_REGION or the active profile, and the endpoint from the region.
 */
struct ObjectStoreSettings {
    std::string endpoint;   ///< e.g. "http://minio:9000"; path-style addressing when set
    std::string region;
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief Validate an endpoint override
 *
 * Accepts "host", "host:port" or either form behind http:// or https://.
 * A trailing '/' is dropped; any other path, a bad port or whitespace
 * is a Configuration error.
 */
Result<std::string> parse_endpoint(const std::string& text);

/**
 * @brief Build an S3 client for the given settings
 *
 * Credentials are resolved by the SDK's default provider chain
 * (environment, shared profile, container or instance role).
 * Aws::InitAPI must already have run; see AwsSdkScope.
 */
std::shared_ptr<Aws::S3::S3Client> make_s3_client(const ObjectStoreSettings& settings);

/// Keeps the AWS SDK initialized for the lifetime of the object.
class AwsSdkScope {
public:
    AwsSdkScope();
    ~AwsSdkScope();

    AwsSdkScope(const AwsSdkScope&) = delete;
    AwsSdkScope& operator=(const AwsSdkScope&) = delete;

private:
    Aws::SDKOptions options_;
};

} // namespace xfer::io
