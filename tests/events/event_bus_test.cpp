#include <gtest/gtest.h>
#include "lfs/events/event_bus.hpp"
#include "lfs/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lfs::events;

TEST(EventBus, DeliversToSubscribersOfThatTypeOnly) {
    EventBus bus;

    int chunk_events = 0;
    int header_events = 0;
    std::size_t last_offset = 0;

    bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent& e) {
        chunk_events++;
        last_offset = e.chunk_offset;
    });
    bus.subscribe<TransactionHeaderPostedEvent>([&](const TransactionHeaderPostedEvent&) { header_events++; });

    bus.emit(ChunkUploadedEvent{"tx-1", 7, 1, 10, 10});
    bus.emit(ChunkUploadedEvent{"tx-1", 3, 2, 10, 20});

    EXPECT_EQ(chunk_events, 2);
    EXPECT_EQ(header_events, 0);
    EXPECT_EQ(last_offset, 3u);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadRetryEvent>([&](const UploadRetryEvent&) { count++; });

    bus.emit(UploadRetryEvent{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<UploadRetryEvent>(id);
    bus.emit(UploadRetryEvent{});
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<UploadRetryEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int delivered = 0;
    bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent&) {
        throw std::runtime_error("progress bar went away");
    });
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(UploadCompletedEvent{"tx-1", 4, 0, std::chrono::milliseconds{10}}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, ConcurrentEmitFromWorkers) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<ChunkUploadedEvent>([&count](const ChunkUploadedEvent&) { count++; });

    std::vector<std::thread> workers;
    for (int i = 0; i < 32; ++i) {
        workers.emplace_back([&bus, i]() {
            bus.emit(ChunkUploadedEvent{"tx-1", static_cast<std::size_t>(i), 0, 32, 0});
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(count, 32);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<UploadFailedEvent>([](const UploadFailedEvent&) {});
    bus.subscribe<UploadRetryEvent>([](const UploadRetryEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadRetryEvent>(), 0u);
}
