#ifndef QUEUE_BASE_H
#define QUEUE_BASE_H

#include <string>
#include <cstddef>

/**
 * @brief Base template for queue implementations
 *
 * Common interface of the queues handing work between threads: the
 * ThreadPool's task queue and the row channel feeding the grid sink.
 *
 * @tparam T Type of items in the queue
 */
template<typename T>
struct QueueBase {
    /**
     * @brief Push an item to the queue, blocking while the queue is full
     *
     * @param item Item to push (rvalue reference)
     * @return true if successful, false if queue is shutting down
     */
    virtual bool push(T &&item) = 0;

    /**
     * @brief Try to push an item to the queue (non-blocking)
     *
     * @param item Item to push (rvalue reference)
     * @return true if successful, false if queue is shutting down or full
     */
    virtual bool try_push(T &&item) = 0;

    /**
     * @brief Pop an item from the queue, blocking while the queue is empty
     *
     * @param item Reference to store the popped item
     * @return true if successful, false if queue is empty and shutting down
     */
    virtual bool pop(T &item) = 0;

    /**
     * @brief Try to pop an item from the queue (non-blocking)
     *
     * @param item Reference to store the popped item
     * @return true if successful, false if queue is empty
     */
    virtual bool try_pop(T &item) = 0;

    /**
     * @brief Signal that no more items will be added to the queue
     */
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool empty() const = 0;

    [[nodiscard]] virtual size_t size() const = 0;

    [[nodiscard]] virtual bool is_shutting_down() const = 0;

    [[nodiscard]] virtual const std::string &name() const = 0;

    /**
     * @brief Approximate bytes held by the queue and the items it stores
     */
    [[nodiscard]] virtual size_t getMemoryUsage() const = 0;

    virtual ~QueueBase() = default;
};

#endif // QUEUE_BASE_H
