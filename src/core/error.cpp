#include "xfer/core/error.hpp"

namespace xfer {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Connection: return "ConnectionError";
        case ErrorKind::SourceRead: return "SourceReadError";
        case ErrorKind::SinkWrite: return "SinkWriteError";
        case ErrorKind::ShortWrite: return "ShortWriteError";
    }
    return "UnknownError";
}

int exit_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return 2;
        case ErrorKind::Connection: return 3;
        case ErrorKind::SourceRead: return 4;
        case ErrorKind::SinkWrite: return 5;
        case ErrorKind::ShortWrite: return 6;
    }
    return 1;
}

std::string Error::describe() const {
    return std::string(to_string(kind)) + ": " + message;
}

} // namespace xfer
