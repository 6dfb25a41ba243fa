//
// Created by Giuseppe Francione on 10/12/25.
//

#include <gtest/gtest.h>
#include "bounded_channel.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace archivist;

TEST(ThreadPoolTest, RunsEveryTask) {
    ThreadPool pool(4, "test");
    EXPECT_EQ(pool.size(), 4u);
    EXPECT_EQ(pool.name(), "test");

    std::vector<std::future<int>> results;
    for (int i = 0; i < 100; ++i) {
        results.push_back(pool.enqueue([i](std::stop_token) { return i * 2; }));
    }
    int sum = 0;
    for (auto& r : results) sum += r.get();
    EXPECT_EQ(sum, 9900);
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.enqueue([](std::stop_token) { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(2);
    auto f = pool.enqueue([](std::stop_token) -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPoolTest, StopReachesRunningTaskAndRejectsNewOnes) {
    ThreadPool pool(1);
    std::promise<void> started;
    auto running = pool.enqueue([&started](const std::stop_token st) {
        started.set_value();
        while (!st.stop_requested()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return true;
    });
    started.get_future().wait();

    pool.request_stop();
    EXPECT_TRUE(running.get());
    EXPECT_THROW(pool.enqueue([](std::stop_token) {}), std::runtime_error);
}

TEST(ThreadPoolTest, IdleOnlyWhenNothingRuns) {
    ThreadPool pool(1);
    EXPECT_TRUE(pool.idle());

    std::promise<void> release;
    std::promise<void> started;
    auto gate = release.get_future().share();
    auto running = pool.enqueue([gate, &started](std::stop_token) {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();
    EXPECT_FALSE(pool.idle());

    release.set_value();
    running.get();
    // the worker marks itself idle just after the future is satisfied
    for (int i = 0; i < 1000 && !pool.idle(); ++i) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    EXPECT_TRUE(pool.idle());
}

TEST(BoundedChannelTest, DrainsAfterClose) {
    BoundedChannel<int> channel(4);
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    channel.close();
    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.push(3));

    EXPECT_EQ(channel.pop().value_or(-1), 1);
    EXPECT_EQ(channel.pop().value_or(-1), 2);
    EXPECT_FALSE(channel.pop().has_value());
}

TEST(BoundedChannelTest, ProducersBlockAtCapacity) {
    BoundedChannel<int> channel(2);
    std::atomic<int> pushed{0};
    std::thread producer([&] {
        for (int i = 0; i < 10; ++i) {
            channel.push(i);
            ++pushed;
        }
        channel.close();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_LE(pushed.load(), 2);

    int count = 0;
    int last = -1;
    while (auto v = channel.pop()) {
        EXPECT_EQ(*v, last + 1);
        last = *v;
        ++count;
    }
    producer.join();
    EXPECT_EQ(count, 10);
}

TEST(BoundedChannelTest, CloseReleasesBlockedProducer) {
    BoundedChannel<int> channel(1);
    ASSERT_TRUE(channel.push(0));
    auto blocked = std::async(std::launch::async, [&] { return channel.push(1); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    EXPECT_FALSE(blocked.get());
}
