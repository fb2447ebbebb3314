#include "xfer/io/file_sink.hpp"
#include "xfer/io/file_source.hpp"
#include "xfer/transfer/engine.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace xfer;
using xfer::io::FileSink;
using xfer::io::FileSource;

namespace {

fs::path create_temp_dir() {
    static std::atomic<std::uint64_t> counter{0};
    const fs::path dir = fs::temp_directory_path() /
                         ("xfer_file_io_test_" + std::to_string(::getpid()) + "_" +
                          std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string binary_payload(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 131) & 0xFF);
    }
    return data;
}

} // namespace

TEST(FileIo, RoundTripThroughEngine) {
    const auto dir = create_temp_dir();
    const auto input = dir / "input.bin";
    const auto output = dir / "output.bin";
    const std::string payload = binary_payload(300 * 1024 + 17);
    write_file(input, payload);

    auto source = FileSource::open(input);
    ASSERT_TRUE(source.is_ok()) << source.error().message;
    EXPECT_EQ(source.value()->total_length(), payload.size());

    FileSink sink(output);
    transfer::TransferEngine engine;
    {
        transfer::SinkSession session(sink);
        ASSERT_TRUE(session.open().is_ok());
        auto result = engine.run(*source.value(), session.sink(), 64 * 1024);
        ASSERT_TRUE(result.is_ok()) << result.error().message;
        EXPECT_EQ(result.value().operations, 5u);
        ASSERT_TRUE(session.close().is_ok());
    }

    EXPECT_EQ(read_file(output), payload);
    fs::remove_all(dir);
}

TEST(FileIo, SinkTruncatesExistingFile) {
    const auto dir = create_temp_dir();
    const auto output = dir / "existing.bin";
    write_file(output, std::string(4096, 'x'));

    FileSink sink(output);
    ASSERT_TRUE(sink.open().is_ok());
    ASSERT_EQ(sink.write({'n', 'e', 'w'}).value(), 3u);
    ASSERT_TRUE(sink.close().is_ok());

    EXPECT_EQ(read_file(output), "new");
    fs::remove_all(dir);
}

TEST(FileIo, SinkEnforcesMaximumWriteSize) {
    const auto dir = create_temp_dir();
    FileSink sink(dir / "out.bin", 16);
    ASSERT_TRUE(sink.open().is_ok());
    EXPECT_EQ(sink.max_operation_size(), 16u);

    auto written = sink.write(std::vector<std::uint8_t>(17, 0));
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::SinkWrite);

    EXPECT_TRUE(sink.write(std::vector<std::uint8_t>(16, 0)).is_ok());
    ASSERT_TRUE(sink.close().is_ok());
    fs::remove_all(dir);
}

TEST(FileIo, SinkDefaultsToEightMebibyteMaximum) {
    FileSink sink("unused.bin");
    EXPECT_EQ(sink.max_operation_size(), 8u * 1024 * 1024);
    EXPECT_FALSE(sink.is_open());
}

TEST(FileIo, WriteToClosedSinkFails) {
    const auto dir = create_temp_dir();
    FileSink sink(dir / "out.bin");

    auto written = sink.write({1, 2, 3});
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::SinkWrite);
    fs::remove_all(dir);
}

TEST(FileIo, UnwritableDestinationIsConnectionError) {
    const auto dir = create_temp_dir();
    FileSink sink(dir / "no_such_dir" / "out.bin");

    auto opened = sink.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().kind, ErrorKind::Connection);
    EXPECT_FALSE(sink.is_open());
    fs::remove_all(dir);
}

TEST(FileIo, MissingSourceIsConnectionError) {
    const auto dir = create_temp_dir();

    auto source = FileSource::open(dir / "missing.bin");
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().kind, ErrorKind::Connection);

    auto directory = FileSource::open(dir);
    EXPECT_TRUE(directory.is_error());
    fs::remove_all(dir);
}

TEST(FileIo, SourceReturnsShortReadOnlyAtEnd) {
    const auto dir = create_temp_dir();
    const auto input = dir / "input.bin";
    write_file(input, "0123456789");

    auto source = FileSource::open(input);
    ASSERT_TRUE(source.is_ok());

    EXPECT_EQ(source.value()->read(4).value().size(), 4u);
    EXPECT_EQ(source.value()->read(4).value().size(), 4u);
    auto tail = source.value()->read(4);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(std::string(tail.value().begin(), tail.value().end()), "89");
    EXPECT_TRUE(source.value()->read(4).value().empty());
    fs::remove_all(dir);
}
