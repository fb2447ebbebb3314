#include "xfer/events/components.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace xfer::events;
using xfer::transfer::ProgressEvent;

TEST(ProgressComponent, RendersProgressLine) {
    EventBus bus;
    std::ostringstream out;
    ProgressComponent progress(bus, out, std::chrono::milliseconds{0});

    bus.emit(TransferStartedEvent{});
    bus.emit(ChunkWrittenEvent{ProgressEvent{65536, 131072, 1}});

    EXPECT_EQ(out.str(), "\rProgress: 50.0% (65,536/131,072 bytes) - Operations: 1");
    EXPECT_EQ(progress.rendered(), 1u);
}

TEST(ProgressComponent, EndsLineOnCompletion) {
    EventBus bus;
    std::ostringstream out;
    ProgressComponent progress(bus, out, std::chrono::milliseconds{0});

    bus.emit(ChunkWrittenEvent{ProgressEvent{10, 20, 1}});
    bus.emit(ChunkWrittenEvent{ProgressEvent{20, 20, 2}});
    bus.emit(TransferCompletedEvent{});

    const std::string text = out.str();
    EXPECT_EQ(progress.rendered(), 2u);
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_NE(text.find("100.0% (20/20 bytes) - Operations: 2"), std::string::npos);
}

TEST(ProgressComponent, ThrottlesIntermediateChunks) {
    EventBus bus;
    std::ostringstream out;
    ProgressComponent progress(bus, out, std::chrono::hours{1});

    for (std::uint64_t op = 1; op <= 10; ++op) {
        bus.emit(ChunkWrittenEvent{ProgressEvent{op * 10, 100, op}});
    }

    // First chunk and the final one are always drawn
    EXPECT_EQ(progress.rendered(), 2u);
    EXPECT_NE(out.str().find("100.0%"), std::string::npos);
}

TEST(ProgressComponent, FailureWithoutProgressWritesNothing) {
    EventBus bus;
    std::ostringstream out;
    ProgressComponent progress(bus, out, std::chrono::milliseconds{0});

    bus.emit(TransferFailedEvent{xfer::Error::connection("refused"), {}});

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(progress.rendered(), 0u);
}

TEST(LoggerComponent, SubscribesToEveryTransferEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ChunkWrittenEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 1u);

    TransferStartedEvent started;
    started.source = "zero:1024";
    started.destination = "null:";
    started.total_bytes = 1024;
    started.requested_chunk_size = 4096;
    started.chunk_size = 512;
    started.max_operation_size = 512;
    EXPECT_NO_THROW(bus.emit(started));
    EXPECT_NO_THROW(bus.emit(TransferFailedEvent{xfer::Error::short_write("3 of 4"), {}}));
}

TEST(LoggerComponent, UnsubscribesWhenDestroyed) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<ChunkWrittenEvent>(), 1u);
    }

    EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ChunkWrittenEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(TransferFailedEvent{xfer::Error::connection("gone"), {}}));
}

TEST(ProgressComponent, BusOutlivingComponentStopsDelivering) {
    EventBus bus;
    std::ostringstream out;
    int other_deliveries = 0;
    bus.subscribe<ChunkWrittenEvent>([&](const ChunkWrittenEvent&) { ++other_deliveries; });

    {
        ProgressComponent progress(bus, out, std::chrono::milliseconds{0});
        bus.emit(ChunkWrittenEvent{ProgressEvent{10, 20, 1}});
        EXPECT_EQ(progress.rendered(), 1u);
        EXPECT_EQ(bus.subscriber_count<ChunkWrittenEvent>(), 2u);
    }

    const std::string before = out.str();
    bus.emit(ChunkWrittenEvent{ProgressEvent{20, 20, 2}});
    bus.emit(TransferCompletedEvent{});

    EXPECT_EQ(out.str(), before);
    EXPECT_EQ(bus.subscriber_count<ChunkWrittenEvent>(), 1u);
    EXPECT_EQ(other_deliveries, 2);
}
