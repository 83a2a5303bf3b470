#ifndef SHARED_QUEUE_HPP
#define SHARED_QUEUE_HPP

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <vector>
#include <stdexcept>

// Raised when a bounded queue rejects work; the server answers 503.
class queue_full_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class shared_queue
 * @brief Mutex-protected FIFO used for worker tasks and for the responses
 * handed back to the I/O thread.
 */
template<typename T>
class shared_queue {
public:
    /**
     * @param capacity Maximum number of queued items, 0 means unbounded.
     */
    explicit shared_queue(size_t capacity = 0) : m_capacity(capacity) {}

    /**
     * @brief Pushes an item and wakes one waiter.
     * @throws queue_full_error if the queue is at capacity.
     */
    void push(T item) {
        if (!try_push(std::move(item))) {
            throw queue_full_error("Queue is full");
        }
    }

    /**
     * @brief Non-throwing push.
     * @return false if the queue is at capacity or stopped; item is dropped.
     */
    bool try_push(T&& item) {
        {
            std::scoped_lock lock(m_mutex);
            if (m_stopped || (m_capacity > 0 && m_queue.size() >= m_capacity)) {
                return false;
            }
            m_queue.push(std::move(item));
        }
        m_cond.notify_one();
        return true;
    }

    /**
     * @brief Blocks until an item is available.
     * @return The item, or std::nullopt once the queue is stopped and drained.
     */
    std::optional<T> wait_and_pop() {
        std::unique_lock lock(m_mutex);
        m_cond.wait(lock, [this] { return !m_queue.empty() || m_stopped; });

        if (m_queue.empty()) {
            return std::nullopt;
        }

        T item = std::move(m_queue.front());
        m_queue.pop();
        return item;
    }

    // Moves everything queued into target without blocking.
    void drain_to(std::vector<T>& target) {
        std::scoped_lock lock(m_mutex);
        while (!m_queue.empty()) {
            target.push_back(std::move(m_queue.front()));
            m_queue.pop();
        }
    }

    void stop() {
        {
            std::scoped_lock lock(m_mutex);
            m_stopped = true;
        }
        m_cond.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(m_mutex);
        return m_queue.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }

private:
    std::queue<T> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_stopped{false};
    const size_t m_capacity;
};

#endif // SHARED_QUEUE_HPP
