#include <gtest/gtest.h>
#include "concurrency/WakeQueue.hpp"

#include <chrono>
#include <string>
#include <thread>

using namespace ds::concurrency;
using namespace std::chrono_literals;

TEST(WakeQueueTest, PushPopFifo) {
    WakeQueue<int> q(3);
    EXPECT_TRUE(q.tryPush(1));
    EXPECT_TRUE(q.tryPush(2));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.tryPop(), 1);
    EXPECT_EQ(q.tryPop(), 2);
    EXPECT_FALSE(q.tryPop().has_value());
}

TEST(WakeQueueTest, FullQueueDropsWithoutBlocking) {
    WakeQueue<int> q(2);
    EXPECT_TRUE(q.tryPush(1));
    EXPECT_TRUE(q.tryPush(2));
    EXPECT_FALSE(q.tryPush(3));
    EXPECT_EQ(q.size(), 2u);
}

TEST(WakeQueueTest, ZeroCapacityDropsEverything) {
    WakeQueue<std::string> q(0);
    EXPECT_FALSE(q.tryPush("file-1"));
    EXPECT_EQ(q.size(), 0u);
    EXPECT_EQ(q.capacity(), 0u);
}

TEST(WakeQueueTest, PopForTimesOutWhenEmpty) {
    WakeQueue<int> q(1);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.popFor(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(WakeQueueTest, PopForWakesOnPush) {
    WakeQueue<int> q(1);
    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        EXPECT_TRUE(q.tryPush(42));
    });
    const auto item = q.popFor(2s);
    producer.join();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 42);
}

TEST(WakeQueueTest, CloseWakesConsumerAndRejectsPushes) {
    WakeQueue<int> q(4);
    std::thread closer([&] {
        std::this_thread::sleep_for(10ms);
        q.close();
    });
    EXPECT_FALSE(q.popFor(5s).has_value());
    closer.join();

    EXPECT_TRUE(q.isClosed());
    EXPECT_FALSE(q.tryPush(1));
}

TEST(WakeQueueTest, CloseStillDrainsQueuedItems) {
    WakeQueue<int> q(4);
    EXPECT_TRUE(q.tryPush(7));
    q.close();
    EXPECT_EQ(q.popFor(10ms), 7);
    EXPECT_FALSE(q.popFor(10ms).has_value());
}
