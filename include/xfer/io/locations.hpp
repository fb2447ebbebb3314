#pragma once

#include "xfer/core/result.hpp"
#include "xfer/io/object_store.hpp"
#include "xfer/transfer/sink.hpp"
#include "xfer/transfer/source.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace xfer::io {

enum class SourceKind {
    Object,  ///< s3://bucket/key
    File,    ///< file:///path or a bare path
    Zero     ///< zero:<size>
};

enum class SinkKind {
    File,    ///< file:///path or a bare path
    Null     ///< null:
};

struct SourceLocation {
    SourceKind kind = SourceKind::File;
    std::string bucket;
    std::string key;
    std::string path;
    std::uint64_t length = 0;
};

struct SinkLocation {
    SinkKind kind = SinkKind::File;
    std::string path;
};

Result<SourceLocation> parse_source_uri(const std::string& uri);
Result<SinkLocation> parse_sink_uri(const std::string& uri);

/**
 * @brief Open the source a location names
 *
 * Object locations get an S3 client built from the settings; opening one
 * performs HeadObject, so connection and permission failures surface here
 * before any sink is touched.
 */
Result<std::unique_ptr<transfer::Source>> open_source(const SourceLocation& location,
                                                      const ObjectStoreSettings& object_store);

/// Construct (but do not open) the sink a location names.
std::unique_ptr<transfer::Sink> make_sink(const SinkLocation& location,
                                          std::size_t max_operation_size);

} // namespace xfer::io
