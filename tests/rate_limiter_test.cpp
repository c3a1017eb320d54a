//
// Copyright (c) 2024-2025 JLGxy
//

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "rate_limiter.h"

using arena::RateLimiter;
using arena::sys_clock;
using namespace std::chrono_literals;

namespace {

struct fake_clock_t {
    sys_clock::time_point now = sys_clock::time_point(1700000000s);
};

}  // namespace

TEST(rateLimiter, capWithinWindow) {
    fake_clock_t clk;
    RateLimiter lim({10, 3600s}, [&] { return clk.now; });
    for (int i = 0; i < 10; i++) {
        EXPECT_TRUE(lim.check_and_record("a", "c")) << i;
        clk.now += 1s;
    }
    EXPECT_FALSE(lim.check_and_record("a", "c"));
    EXPECT_FALSE(lim.check_and_record("a", "c"));
    // other pairs are independent
    EXPECT_TRUE(lim.check_and_record("b", "c"));
    EXPECT_TRUE(lim.check_and_record("a", "d"));
}

TEST(rateLimiter, rollingWindow) {
    fake_clock_t clk;
    RateLimiter lim({2, 100s}, [&] { return clk.now; });
    EXPECT_TRUE(lim.check_and_record("a", "c"));
    clk.now += 50s;
    EXPECT_TRUE(lim.check_and_record("a", "c"));
    clk.now += 49s;
    EXPECT_FALSE(lim.check_and_record("a", "c"));
    clk.now += 1s;  // the first admission is exactly one window old
    EXPECT_TRUE(lim.check_and_record("a", "c"));
    EXPECT_FALSE(lim.check_and_record("a", "c"));
}

TEST(rateLimiter, status) {
    fake_clock_t clk;
    RateLimiter lim({3, 60s}, [&] { return clk.now; });
    auto st = lim.status("a", "c");
    EXPECT_EQ(st.used, 0u);
    EXPECT_EQ(st.remaining, 3u);
    EXPECT_EQ(st.reset_seconds, 0);

    for (int i = 0; i < 3; i++) {
        lim.check_and_record("a", "c");
        clk.now += 10s;
    }
    st = lim.status("a", "c");
    EXPECT_EQ(st.used, 3u);
    EXPECT_EQ(st.remaining, 0u);
    EXPECT_EQ(st.reset_seconds, 30);

    clk.now += 30s;
    st = lim.status("a", "c");
    EXPECT_EQ(st.used, 2u);
    EXPECT_EQ(st.remaining, 1u);
}

TEST(rateLimiter, rollback) {
    fake_clock_t clk;
    RateLimiter lim({1, 60s}, [&] { return clk.now; });
    EXPECT_TRUE(lim.check_and_record("a", "c"));
    lim.rollback("a", "c");
    EXPECT_EQ(lim.status("a", "c").used, 0u);
    lim.rollback("a", "c");
    EXPECT_EQ(lim.tracked_pairs(), 0u);
    lim.rollback("nobody", "c");
    EXPECT_EQ(lim.tracked_pairs(), 0u);
}

TEST(rateLimiter, expiredPairsForgotten) {
    fake_clock_t clk;
    RateLimiter lim({5, 3600s}, [&] { return clk.now; });
    for (int i = 0; i < 100; i++) {
        EXPECT_TRUE(lim.check_and_record("old" + std::to_string(i), "c"));
    }
    EXPECT_EQ(lim.tracked_pairs(), 100u);

    clk.now += 2h;
    for (int i = 0; i < 30; i++) {
        EXPECT_TRUE(lim.check_and_record("new" + std::to_string(i), "c"));
    }
    EXPECT_EQ(lim.tracked_pairs(), 30u);
    EXPECT_EQ(lim.status("old0", "c").used, 0u);
}

TEST(rateLimiter, zeroCapKeepsNothing) {
    RateLimiter lim({0, 3600s});
    EXPECT_FALSE(lim.check_and_record("a", "c"));
    EXPECT_EQ(lim.tracked_pairs(), 0u);
}

TEST(rateLimiter, concurrentAdmissions) {
    RateLimiter lim({50, 3600s});
    std::vector<std::thread> threads;
    std::atomic<int> admitted{0};
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; i++) {
                if (lim.check_and_record("a", "c")) admitted++;
            }
        });
    }
    for (auto &t : threads) t.join();
    EXPECT_EQ(admitted.load(), 50);
}
