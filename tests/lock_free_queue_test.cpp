// tests/lock_free_queue_test.cpp

#include <gtest/gtest.h>
#include <thread>

#include "lock_free_queue.hpp"

TEST(LockFreeQueueTest, PushUntilFullThenPop) {
    LockFreeQueue<int> q(2);
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(q.capacity(), 2u);

    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_FALSE(q.push(3));
    EXPECT_EQ(q.size(), 2u);

    int v = 0;
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 1);
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 2);
    EXPECT_FALSE(q.pop(v));
}

TEST(LockFreeQueueTest, SingleProducerSingleConsumerKeepsOrder) {
    const int total = 20000;
    LockFreeQueue<int> q(8);

    std::thread producer([&]() {
        for (int i = 0; i < total; i++) {
            while (!q.push(i)) {
                std::this_thread::yield();
            }
        }
    });

    // Always takes every item so the producer finishes and can be joined
    int received = 0;
    int out_of_order = 0;
    int v = 0;
    while (received < total) {
        if (!q.pop(v)) {
            std::this_thread::yield();
            continue;
        }
        if (v != received) out_of_order++;
        received++;
    }
    producer.join();

    EXPECT_EQ(out_of_order, 0);
    EXPECT_TRUE(q.empty());
}
