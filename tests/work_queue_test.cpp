//
// Copyright (c) 2024-2025 JLGxy
//

#include <optional>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "work_queue.h"

TEST(workQueue, boundedFifo) {
    arena::WorkQueue<int> q(2);
    EXPECT_EQ(q.capacity(), 2u);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_FALSE(q.try_push(3));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.pop(), 1);
    EXPECT_TRUE(q.try_push(3));
    EXPECT_EQ(q.pop(), 2);
    EXPECT_EQ(q.pop(), 3);
}

TEST(workQueue, reservationsHoldSlots) {
    arena::WorkQueue<std::string> q(1);
    ASSERT_TRUE(q.try_reserve());
    EXPECT_FALSE(q.try_reserve());
    EXPECT_EQ(q.size(), 0u);
    q.cancel_reservation();
    ASSERT_TRUE(q.try_reserve());
    q.push_reserved("id");
    EXPECT_EQ(q.size(), 1u);
    EXPECT_FALSE(q.try_push("other"));
}

TEST(workQueue, closeWakesConsumers) {
    arena::WorkQueue<int> q(4);
    std::optional<int> got = 0;
    std::thread consumer([&] { got = q.pop(); });
    q.close();
    consumer.join();
    EXPECT_FALSE(got.has_value());
    EXPECT_FALSE(q.try_push(1));
}
