#pragma once

#include <utility>
#include <algorithm>
#include <type_traits>
#include "../../Debug/headers/LogMacros.h"

namespace queue_detail {
    template<typename U>
    size_t itemMemoryUsage(const U &item) {
        if constexpr (requires { item.getMemoryUsage(); }) {
            return static_cast<size_t>(item.getMemoryUsage());
        } else if constexpr (requires { item->getMemoryUsage(); }) {
            return item ? static_cast<size_t>(item->getMemoryUsage()) : sizeof(U);
        } else {
            return sizeof(U);
        }
    }
}

template<typename T>
ThreadSafeQueue<T>::ThreadSafeQueue(size_t max_size, std::string queue_name)
    : max_size_(std::max<size_t>(max_size, 1)), shutting_(false), size_(0), queue_name_(std::move(queue_name)) {
    LOG_DBG("ThreadSafeQueue",
            "Created ThreadSafeQueue '" + queue_name_ + "' with max size " +
            (max_size == SIZE_MAX ? std::string("unlimited") : std::to_string(max_size)));
}

template<typename T>
ThreadSafeQueue<T>::~ThreadSafeQueue() {
    size_t remaining = size_.load();
    ThreadSafeQueue<T>::shutdown();
    clear();
    if (remaining > 0) {
        LOG_DBG("ThreadSafeQueue",
                "ThreadSafeQueue '" + queue_name_ + "' destroyed with " + std::to_string(remaining) + " items remaining");
    }
}

template<typename T>
void ThreadSafeQueue<T>::take_front_locked(T &item) {
    item = std::move(queue_.front());
    queue_.pop_front();
    size_.fetch_sub(1, std::memory_order_release);
    if (queue_.empty()) {
        empty_.notify_all();
    }
}

template<typename T>
bool ThreadSafeQueue<T>::push(T &&item) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutting_.load(std::memory_order_acquire)) {
        return false;
    }

    // Backpressure: wait for space to become available
    not_full_.wait(lock, [this] {
        return queue_.size() < max_size_ || shutting_.load(std::memory_order_acquire);
    });
    if (shutting_.load(std::memory_order_acquire)) {
        return false;
    }

    queue_.push_back(std::move(item));
    size_.fetch_add(1, std::memory_order_release);
    high_water_mark_ = std::max(high_water_mark_, queue_.size());

    lock.unlock();
    not_empty_.notify_one();
    return true;
}

template<typename T>
bool ThreadSafeQueue<T>::try_push(T &&item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (shutting_.load(std::memory_order_acquire) || queue_.size() >= max_size_) {
            return false;
        }

        queue_.push_back(std::move(item));
        size_.fetch_add(1, std::memory_order_release);
        high_water_mark_ = std::max(high_water_mark_, queue_.size());
    }
    not_empty_.notify_one();
    return true;
}

template<typename T>
bool ThreadSafeQueue<T>::pop(T &item) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait until there's an item or we're shutting down
    not_empty_.wait(lock, [this] {
        return !queue_.empty() || shutting_.load(std::memory_order_acquire);
    });

    // Shut down and drained
    if (queue_.empty()) {
        return false;
    }

    take_front_locked(item);

    lock.unlock();
    not_full_.notify_one();
    return true;
}

template<typename T>
bool ThreadSafeQueue<T>::try_pop(T &item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        take_front_locked(item);
    }
    not_full_.notify_one();
    return true;
}

template<typename T>
bool ThreadSafeQueue<T>::pop_for(T &item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = not_empty_.wait_for(lock, timeout, [this] {
        return !queue_.empty() || shutting_.load(std::memory_order_acquire);
    });
    if (!ready || queue_.empty()) {
        return false;
    }

    take_front_locked(item);

    lock.unlock();
    not_full_.notify_one();
    return true;
}

template<typename T>
void ThreadSafeQueue<T>::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
    }

    not_empty_.notify_all();
    not_full_.notify_all();
    empty_.notify_all();

    LOG_DBG("ThreadSafeQueue", "ThreadSafeQueue '" + queue_name_ + "': Shutdown initiated");
}

template<typename T>
bool ThreadSafeQueue<T>::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

template<typename T>
size_t ThreadSafeQueue<T>::size() const {
    return size_.load(std::memory_order_acquire);
}

template<typename T>
bool ThreadSafeQueue<T>::is_shutting_down() const {
    return shutting_.load(std::memory_order_acquire);
}

template<typename T>
const std::string &ThreadSafeQueue<T>::name() const {
    return queue_name_;
}

template<typename T>
size_t ThreadSafeQueue<T>::clear() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::deque<T> empty;
        std::swap(queue_, empty);
        dropped = empty.size();
        size_.store(0, std::memory_order_release);
    }
    not_full_.notify_all();
    empty_.notify_all();
    return dropped;
}

template<typename T>
size_t ThreadSafeQueue<T>::getMemoryUsage() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t usage = sizeof(*this);
    for (const auto &item : queue_) {
        usage += queue_detail::itemMemoryUsage(item);
    }
    return usage;
}

template<typename T>
bool ThreadSafeQueue<T>::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() >= max_size_;
}

template<typename T>
void ThreadSafeQueue<T>::wait_until_empty() {
    std::unique_lock<std::mutex> lock(mutex_);
    empty_.wait(lock, [this] { return queue_.empty() || shutting_.load(std::memory_order_acquire); });
}

template<typename T>
size_t ThreadSafeQueue<T>::capacity() const {
    return max_size_;
}

template<typename T>
size_t ThreadSafeQueue<T>::high_water_mark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_mark_;
}
