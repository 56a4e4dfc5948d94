#include <gtest/gtest.h>
#include "lft/events/event_queue.hpp"
#include "lft/events/events.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace lft::events;

TEST(ThreadSafeQueue, PushAndPopKeepOrder) {
    ThreadSafeQueue<int> queue;

    queue.push(42);
    queue.push(100);

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(ThreadSafeQueue, TryPopOnEmptyQueue) {
    ThreadSafeQueue<int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(123);
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 123);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto value = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(elapsed.count(), 90);  // some scheduler tolerance
}

TEST(ThreadSafeQueue, DrainTakesEverythingInOrder) {
    ThreadSafeQueue<int> queue;
    EXPECT_TRUE(queue.drain().empty());

    for (int i = 0; i < 5; ++i) {
        queue.push(i);
    }
    EXPECT_EQ(queue.size(), 5u);

    const auto items = queue.drain();
    EXPECT_EQ(items, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueue, ShutdownWakesConsumerButKeepsQueuedItems) {
    ThreadSafeQueue<int> queue;
    queue.push(7);
    queue.shutdown();
    EXPECT_TRUE(queue.is_shutdown());

    auto queued = queue.pop();
    ASSERT_TRUE(queued.has_value());
    EXPECT_EQ(queued.value(), 7);

    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, CarriesTransferEventsAcrossThreads) {
    ThreadSafeQueue<TransferEvent> queue;
    std::atomic<std::uint64_t> bytes{0};

    std::thread producer([&queue]() {
        for (std::uint64_t i = 1; i <= 100; ++i) {
            queue.push(ProgressUpdated{i, i * 10, 100, 1000, 0.0});
        }
        queue.push(TransferFinished{});
        queue.shutdown();
    });

    bool finished_seen = false;
    std::thread consumer([&]() {
        while (auto event = queue.pop()) {
            if (const auto* progress = std::get_if<ProgressUpdated>(&*event)) {
                bytes = progress->bytes;
            } else if (std::holds_alternative<TransferFinished>(*event)) {
                finished_seen = true;
            }
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(bytes.load(), 1000u);
    EXPECT_TRUE(finished_seen);
}
