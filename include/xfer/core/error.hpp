#pragma once

#include <string>
#include <utility>

namespace xfer {

/**
 * @brief Failure categories surfaced by the transfer pipeline
 *
 * Configuration is detected before any I/O. Connection covers collaborators
 * that could not be opened or negotiated. The remaining kinds are raised
 * mid-transfer and abort it immediately.
 */
enum class ErrorKind {
    Configuration,
    Connection,
    SourceRead,
    SinkWrite,
    ShortWrite
};

struct Error {
    ErrorKind kind = ErrorKind::Configuration;
    std::string message;

    static Error configuration(std::string message) {
        return Error{ErrorKind::Configuration, std::move(message)};
    }
    static Error connection(std::string message) {
        return Error{ErrorKind::Connection, std::move(message)};
    }
    static Error source_read(std::string message) {
        return Error{ErrorKind::SourceRead, std::move(message)};
    }
    static Error sink_write(std::string message) {
        return Error{ErrorKind::SinkWrite, std::move(message)};
    }
    static Error short_write(std::string message) {
        return Error{ErrorKind::ShortWrite, std::move(message)};
    }

    /// "<KindName>: <message>"
    std::string describe() const;
};

const char* to_string(ErrorKind kind);

/// Process exit status used by the command-line tool for each kind.
int exit_code(ErrorKind kind);

} // namespace xfer
