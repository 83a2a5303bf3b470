#include "thread_pool.hpp"
#include "shared_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

namespace {

TEST(SharedQueueTest, PopsInFifoOrder) {
    shared_queue<int> queue;
    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2U);
    EXPECT_EQ(queue.wait_and_pop(), 1);
    EXPECT_EQ(queue.wait_and_pop(), 2);
}

TEST(SharedQueueTest, BoundedQueueRejectsWhenFull) {
    shared_queue<int> queue(2);
    queue.push(1);
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_THROW(queue.push(4), queue_full_error);
    EXPECT_EQ(queue.size(), 2U);
    EXPECT_EQ(queue.capacity(), 2U);
}

TEST(SharedQueueTest, DrainMovesEverything) {
    shared_queue<int> queue;
    for (int i = 0; i < 5; ++i) {
        queue.push(i);
    }
    std::vector<int> out;
    queue.drain_to(out);
    EXPECT_EQ(out, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(queue.size(), 0U);
}

TEST(SharedQueueTest, StopWakesWaiters) {
    shared_queue<int> queue;
    std::optional<int> popped{0};
    std::jthread waiter([&] { popped = queue.wait_and_pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.stop();
    waiter.join();
    EXPECT_FALSE(popped.has_value());
    EXPECT_FALSE(queue.try_push(1));
}

TEST(ThreadPoolTest, RunsAllTasks) {
    constexpr int k_tasks = 200;
    std::atomic<int> counter{0};
    std::latch done(k_tasks);
    {
        thread_pool pool(4);
        pool.start();
        for (int i = 0; i < k_tasks; ++i) {
            pool.push_task([&] {
                counter.fetch_add(1);
                done.count_down();
            });
        }
        done.wait();
    }
    EXPECT_EQ(counter.load(), k_tasks);
}

TEST(ThreadPoolTest, SurvivesThrowingTask) {
    std::latch done(1);
    thread_pool pool(1);
    pool.start();
    pool.push_task([] { throw std::runtime_error("boom"); });
    pool.push_task([&] { done.count_down(); });
    done.wait();
}

TEST(ThreadPoolTest, FullQueueRaisesQueueFullError) {
    thread_pool pool(1, 1);
    // Not started: nothing drains the queue.
    pool.push_task([] {});
    EXPECT_EQ(pool.get_total_pending_tasks(), 1U);
    EXPECT_THROW(pool.push_task([] {}), queue_full_error);
}

} // namespace
