#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include "shared_queue.hpp"
#include "logger.hpp"
#include <vector>
#include <thread>
#include <functional>
#include <atomic>
#include <memory>

using dispatch_task = std::function<void()>;

/**
 * @class thread_pool
 * @brief Fixed set of worker threads, each draining its own queue.
 *
 * The owning I/O thread distributes tasks round-robin; workers never steal.
 */
class thread_pool {
public:
    /**
     * @param num_threads Number of workers, at least one.
     * @param queue_capacity Per-worker queue limit, 0 means unbounded.
     */
    explicit thread_pool(size_t num_threads, size_t queue_capacity = 0)
        : m_num_threads(num_threads == 0 ? 1 : num_threads) {
        m_task_queues.reserve(m_num_threads);
        for (size_t i = 0; i < m_num_threads; ++i) {
            m_task_queues.push_back(std::make_unique<shared_queue<dispatch_task>>(queue_capacity));
        }
    }

    ~thread_pool() noexcept {
        stop();
    }

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    void start() {
        for (size_t i = 0; i < m_num_threads; ++i) {
            m_threads.emplace_back([this, i] { worker_loop(i); });
        }
        util::log::debug("Thread pool started with {} threads.", m_num_threads);
    }

    // Pending tasks still run; joins all workers.
    void stop() noexcept {
        if (m_stopped.exchange(true)) {
            return;
        }
        for (const auto& queue : m_task_queues) {
            queue->stop();
        }
        m_threads.clear();
    }

    /**
     * @brief Queues a task on the next worker in round-robin order.
     * @throws queue_full_error when that worker's queue is at capacity.
     */
    void push_task(dispatch_task task) {
        const size_t queue_index = m_next_queue.fetch_add(1, std::memory_order_relaxed) % m_num_threads;
        m_task_queues[queue_index]->push(std::move(task));
    }

    [[nodiscard]] size_t get_total_pending_tasks() const {
        size_t total_tasks = 0;
        for (const auto& queue : m_task_queues) {
            total_tasks += queue->size();
        }
        return total_tasks;
    }

    [[nodiscard]] size_t size() const noexcept { return m_num_threads; }

private:
    void worker_loop(size_t queue_index) {
        auto& my_queue = *m_task_queues[queue_index];

        while (auto task = my_queue.wait_and_pop()) {
            if (!*task) {
                continue;
            }
            try {
                (*task)();
            } catch (const std::exception& e) {
                util::log::error("Exception caught in worker thread {}: {}", queue_index, e.what());
            }
        }
        util::log::debug("Worker thread {} finished.", queue_index);
    }

    const size_t m_num_threads;
    std::atomic<bool> m_stopped{false};
    std::atomic<size_t> m_next_queue{0};

    std::vector<std::unique_ptr<shared_queue<dispatch_task>>> m_task_queues;
    std::vector<std::jthread> m_threads;
};

#endif // THREAD_POOL_HPP
