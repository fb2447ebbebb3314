#pragma once

#include "xfer/transfer/sink.hpp"
#include "xfer/transfer/source.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xfer::io {

/**
 * @brief In-memory source over a byte vector
 */
class MemorySource : public transfer::Source {
public:
    using Data = std::vector<std::uint8_t>;

    explicit MemorySource(Data data) : data_(std::move(data)) {}

    std::uint64_t total_length() const override { return data_.size(); }
    Result<Data> read(std::size_t max_bytes) override;
    std::string describe() const override { return "memory"; }

    std::size_t position() const noexcept { return position_; }

private:
    Data data_;
    std::size_t position_ = 0;
};

/**
 * @brief Zero-filled stream of a fixed length
 *
 * Used to benchmark write sizes without a real source.
 */
class ZeroSource : public transfer::Source {
public:
    explicit ZeroSource(std::uint64_t length) : length_(length) {}

    std::uint64_t total_length() const override { return length_; }
    Result<std::vector<std::uint8_t>> read(std::size_t max_bytes) override;
    std::string describe() const override { return "zero:" + std::to_string(length_); }

private:
    std::uint64_t length_;
    std::uint64_t produced_ = 0;
};

/**
 * @brief Sink that discards everything it accepts
 */
class NullSink : public transfer::Sink {
public:
    explicit NullSink(std::size_t max_operation_size) : max_operation_size_(max_operation_size) {}

    Result<void> open() override;
    Result<void> close() override;
    bool is_open() const override { return open_; }

    std::size_t max_operation_size() const override { return max_operation_size_; }
    Result<std::size_t> write(const std::vector<std::uint8_t>& buffer) override;

    std::string describe() const override { return "null:"; }

    std::uint64_t bytes_discarded() const noexcept { return discarded_; }

private:
    std::size_t max_operation_size_;
    bool open_ = false;
    std::uint64_t discarded_ = 0;
};

/**
 * @brief Sink that appends every write to an owned buffer
 *
 * write_sizes() records the size of each accepted write in order.
 */
class MemorySink : public transfer::Sink {
public:
    using Data = std::vector<std::uint8_t>;

    explicit MemorySink(std::size_t max_operation_size) : max_operation_size_(max_operation_size) {}

    Result<void> open() override;
    Result<void> close() override;
    bool is_open() const override { return open_; }

    std::size_t max_operation_size() const override { return max_operation_size_; }
    Result<std::size_t> write(const Data& buffer) override;

    std::string describe() const override { return "memory"; }

    const Data& data() const noexcept { return data_; }
    const std::vector<std::size_t>& write_sizes() const noexcept { return write_sizes_; }
    int open_count() const noexcept { return open_count_; }
    int close_count() const noexcept { return close_count_; }

private:
    std::size_t max_operation_size_;
    bool open_ = false;
    Data data_;
    std::vector<std::size_t> write_sizes_;
    int open_count_ = 0;
    int close_count_ = 0;
};

} // namespace xfer::io
