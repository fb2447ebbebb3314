#include "xfer/io/object_source.hpp"

#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace xfer::io {
namespace {

std::string error_text(const Aws::S3::S3Error& error) {
    std::string text = fmt::format("HTTP {}", static_cast<int>(error.GetResponseCode()));
    if (!error.GetExceptionName().empty()) {
        text += " " + std::string(error.GetExceptionName().c_str());
    }
    if (!error.GetMessage().empty()) {
        text += ": " + std::string(error.GetMessage().c_str());
    }
    return text;
}

} // namespace

std::string ObjectSource::byte_range(std::uint64_t first, std::uint64_t last) {
    return fmt::format("bytes={}-{}", first, last);
}

ObjectSource::ObjectSource(PrivateTag, std::shared_ptr<Aws::S3::S3Client> client,
                           std::string bucket, std::string key)
    : client_(std::move(client)), bucket_(std::move(bucket)), key_(std::move(key)) {}

Result<std::unique_ptr<ObjectSource>> ObjectSource::open(std::shared_ptr<Aws::S3::S3Client> client,
                                                         std::string bucket,
                                                         std::string key) {
    using Ptr = std::unique_ptr<ObjectSource>;

    if (!client) {
        return Err<Ptr>(ErrorKind::Configuration, "Object source needs an S3 client");
    }
    if (bucket.empty() || key.empty()) {
        return Err<Ptr>(ErrorKind::Configuration, "Object source needs both a bucket and a key");
    }

    auto source = std::make_unique<ObjectSource>(PrivateTag{}, std::move(client),
                                                 std::move(bucket), std::move(key));

    Aws::S3::Model::HeadObjectRequest request;
    request.WithBucket(source->bucket_.c_str()).WithKey(source->key_.c_str());

    auto outcome = source->client_->HeadObject(request);
    if (!outcome.IsSuccess()) {
        return Err<Ptr>(ErrorKind::Connection,
                        "Object info request for " + source->describe() + " failed: " +
                            error_text(outcome.GetError()));
    }

    const long long length = outcome.GetResult().GetContentLength();
    if (length < 0) {
        return Err<Ptr>(ErrorKind::Connection,
                        "Object info for " + source->describe() + " reports an invalid size: " +
                            std::to_string(length));
    }

    source->total_length_ = static_cast<std::uint64_t>(length);
    spdlog::info("Object {} size: {} bytes", source->describe(), source->total_length_);
    return Ok(std::move(source));
}

Result<std::vector<std::uint8_t>> ObjectSource::read(std::size_t max_bytes) {
    using Bytes = std::vector<std::uint8_t>;

    if (max_bytes == 0 || offset_ >= total_length_) {
        return Ok(Bytes{});
    }

    const std::uint64_t first = offset_;
    const std::uint64_t last = std::min<std::uint64_t>(offset_ + max_bytes, total_length_) - 1;
    const std::uint64_t expected = last - first + 1;

    Aws::S3::Model::GetObjectRequest request;
    request.WithBucket(bucket_.c_str()).WithKey(key_.c_str());
    request.SetRange(byte_range(first, last).c_str());

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        return Err<Bytes>(ErrorKind::SourceRead,
                          fmt::format("Ranged read of {} at offset {} failed: {}", describe(),
                                      first, error_text(outcome.GetError())));
    }

    Aws::S3::Model::GetObjectResult result{outcome.GetResultWithOwnership()};
    auto& body = result.GetBody();

    // No Content-Range means the server ignored the Range and sent the whole object
    if (result.GetContentRange().empty() && first > 0) {
        body.ignore(static_cast<std::streamsize>(first));
    }

    Bytes data(static_cast<std::size_t>(expected));
    body.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(expected));
    if (body.bad()) {
        return Err<Bytes>(ErrorKind::SourceRead,
                          fmt::format("Reading the body of {} at offset {} failed", describe(),
                                      first));
    }
    data.resize(static_cast<std::size_t>(body.gcount()));

    if (data.size() != expected) {
        return Err<Bytes>(ErrorKind::SourceRead,
                          fmt::format("Ranged read of {} at offset {} returned {} bytes, expected {}",
                                      describe(), first, data.size(), expected));
    }

    offset_ += data.size();
    return Ok(std::move(data));
}

std::string ObjectSource::describe() const {
    return "s3://" + bucket_ + "/" + key_;
}

} // namespace xfer::io
