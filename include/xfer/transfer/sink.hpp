#pragma once

#include "xfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xfer::transfer {

/**
 * @brief Sequential byte consumer bound by a maximum single-write size
 *
 * max_operation_size() is only meaningful once open() succeeded; it plays
 * the role of a protocol-negotiated maximum write. Writes are persisted in
 * the order they are issued.
 */
class Sink {
public:
    virtual ~Sink() = default;

    virtual Result<void> open() = 0;
    virtual Result<void> close() = 0;
    virtual bool is_open() const = 0;

    virtual std::size_t max_operation_size() const = 0;

    /// Returns the number of bytes actually persisted.
    virtual Result<std::size_t> write(const std::vector<std::uint8_t>& buffer) = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Scoped acquisition of a sink
 *
 * The destructor closes a sink this session opened, on every exit path.
 * Close failures on that path are logged; call close() explicitly to
 * observe them.
 */
class SinkSession {
public:
    explicit SinkSession(Sink& sink) : sink_(sink) {}
    ~SinkSession();

    SinkSession(const SinkSession&) = delete;
    SinkSession& operator=(const SinkSession&) = delete;

    Result<void> open();
    Result<void> close();

    Sink& sink() noexcept { return sink_; }
    bool is_open() const { return opened_ && sink_.is_open(); }

private:
    Sink& sink_;
    bool opened_ = false;
};

} // namespace xfer::transfer
