#include "xfer/io/locations.hpp"
#include "xfer/io/file_sink.hpp"
#include "xfer/io/file_source.hpp"
#include "xfer/io/object_source.hpp"
#include "xfer/io/synthetic.hpp"
#include "xfer/transfer/buffer_sizer.hpp"

namespace xfer::io {
namespace {

constexpr const char* kObjectScheme = "s3://";
constexpr const char* kFileScheme = "file://";
constexpr const char* kZeroScheme = "zero:";
constexpr const char* kNullScheme = "null:";

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

// "file:///tmp/x" -> "/tmp/x"; anything without a scheme is taken as a path
Result<std::string> file_path(const std::string& uri) {
    std::string path = uri;
    if (starts_with(uri, kFileScheme)) {
        path = uri.substr(std::char_traits<char>::length(kFileScheme));
        if (!path.empty() && path.front() != '/') {
            return Err<std::string>(ErrorKind::Configuration,
                                    "file:// URIs must name an absolute path: " + uri);
        }
    }
    if (path.empty()) {
        return Err<std::string>(ErrorKind::Configuration, "Empty file path in " + uri);
    }
    return Ok(std::move(path));
}

} // namespace

Result<SourceLocation> parse_source_uri(const std::string& uri) {
    SourceLocation location;

    if (uri.empty()) {
        return Err<SourceLocation>(ErrorKind::Configuration, "Source is required");
    }

    if (starts_with(uri, kObjectScheme)) {
        const std::string rest = uri.substr(std::char_traits<char>::length(kObjectScheme));
        const auto slash = rest.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == rest.size()) {
            return Err<SourceLocation>(ErrorKind::Configuration,
                                       "Object URI must look like s3://bucket/key: " + uri);
        }
        location.kind = SourceKind::Object;
        location.bucket = rest.substr(0, slash);
        location.key = rest.substr(slash + 1);
        return Ok(std::move(location));
    }

    if (starts_with(uri, kZeroScheme)) {
        auto length = transfer::parse_size(uri.substr(std::char_traits<char>::length(kZeroScheme)));
        if (length.is_error()) {
            return Err<SourceLocation>(ErrorKind::Configuration,
                                       "Invalid length in " + uri + ": " + length.error().message);
        }
        location.kind = SourceKind::Zero;
        location.length = length.value();
        return Ok(std::move(location));
    }

    auto path = file_path(uri);
    if (path.is_error()) {
        return path.forward_error<SourceLocation>();
    }
    location.kind = SourceKind::File;
    location.path = std::move(path.value());
    return Ok(std::move(location));
}

Result<SinkLocation> parse_sink_uri(const std::string& uri) {
    SinkLocation location;

    if (uri.empty()) {
        return Err<SinkLocation>(ErrorKind::Configuration, "Destination is required");
    }
    if (uri == kNullScheme) {
        location.kind = SinkKind::Null;
        return Ok(std::move(location));
    }
    if (starts_with(uri, kObjectScheme)) {
        return Err<SinkLocation>(ErrorKind::Configuration,
                                 "Object storage is not supported as a destination: " + uri);
    }

    auto path = file_path(uri);
    if (path.is_error()) {
        return path.forward_error<SinkLocation>();
    }
    location.kind = SinkKind::File;
    location.path = std::move(path.value());
    return Ok(std::move(location));
}

Result<std::unique_ptr<transfer::Source>> open_source(const SourceLocation& location,
                                                      const ObjectStoreSettings& object_store) {
    using Ptr = std::unique_ptr<transfer::Source>;

    switch (location.kind) {
        case SourceKind::Object: {
            auto source = ObjectSource::open(make_s3_client(object_store), location.bucket,
                                             location.key);
            if (source.is_error()) {
                return source.forward_error<Ptr>();
            }
            return Ok<Ptr>(std::move(source.value()));
        }
        case SourceKind::File: {
            auto source = FileSource::open(location.path);
            if (source.is_error()) {
                return source.forward_error<Ptr>();
            }
            return Ok<Ptr>(std::move(source.value()));
        }
        case SourceKind::Zero:
            return Ok<Ptr>(std::make_unique<ZeroSource>(location.length));
    }
    return Err<Ptr>(ErrorKind::Configuration, "Unknown source kind");
}

std::unique_ptr<transfer::Sink> make_sink(const SinkLocation& location,
                                          std::size_t max_operation_size) {
    if (location.kind == SinkKind::Null) {
        return std::make_unique<NullSink>(max_operation_size);
    }
    return std::make_unique<FileSink>(location.path, max_operation_size);
}

} // namespace xfer::io
