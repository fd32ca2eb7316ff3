#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <string>
#include <cstdint>

#include "QueueBase.h"

/**
 * @brief Thread-safe bounded queue for producer/consumer hand-off
 *
 * This class provides a thread-safe queue with the following features:
 * - Generic template implementation for any movable type
 * - Bounded capacity with flow control (producers block while full)
 * - Blocking, non-blocking and timed pop operations
 * - Explicit shutdown semantics
 *
 * Thread Safety Guarantees:
 * - Multiple threads can call push/pop/etc. concurrently
 * - After shutdown() is called, push operations will fail and pop operations
 *   will drain the queue and then return false
 * - All waiting threads will be unblocked when shutdown() is called
 *
 * @tparam T The type of elements stored in the queue
 */
template<typename T>
struct ThreadSafeQueue : public QueueBase<T> {
public:
    /**
     * @brief Construct a new ThreadSafeQueue
     *
     * @param max_size Maximum capacity of the queue (SIZE_MAX for unbounded)
     * @param queue_name Name identifier for this queue (for logging)
     */
    explicit ThreadSafeQueue(size_t max_size = 100, std::string queue_name = "DefaultQueue");

    ~ThreadSafeQueue() override;

    ThreadSafeQueue(const ThreadSafeQueue &) = delete;
    ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

    bool push(T &&item) override;

    bool try_push(T &&item) override;

    bool pop(T &item) override;

    bool try_pop(T &item) override;

    /**
     * @brief Pop with a deadline
     *
     * @param item Reference to store the popped item
     * @param timeout Maximum time to wait for an item
     * @return true if an item was popped before the timeout
     */
    bool pop_for(T &item, std::chrono::milliseconds timeout);

    /**
     * @brief Signal that no more items will be added to the queue
     *
     * After this is called, push operations will fail and pop operations
     * will drain the queue and then return false.
     */
    void shutdown() override;

    [[nodiscard]] bool is_shutting_down() const override;

    [[nodiscard]] size_t size() const override;

    [[nodiscard]] bool empty() const override;

    [[nodiscard]] bool full() const;

    /**
     * @brief Drop all queued items and wake blocked producers
     * @return Number of items dropped
     */
    size_t clear();

    /**
     * @brief Block until the queue is drained or shut down
     */
    void wait_until_empty();

    [[nodiscard]] const std::string& name() const override;

    [[nodiscard]] size_t capacity() const;

    /**
     * @brief Largest number of items held at once since construction
     */
    [[nodiscard]] size_t high_water_mark() const;

    [[nodiscard]] size_t getMemoryUsage() const override;

private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_; // Signaled when items are added
    std::condition_variable not_full_; // Signaled when items are removed
    std::condition_variable empty_; // Signaled when queue becomes empty
    size_t max_size_;
    std::atomic<bool> shutting_;
    std::atomic<size_t> size_; // Mirrors queue_.size() for lock-free reads
    size_t high_water_mark_{0};
    std::string queue_name_;

    void take_front_locked(T &item);
};

#include "../inlines/ThreadSafeQueue.inl"

#endif // THREAD_SAFE_QUEUE_H
