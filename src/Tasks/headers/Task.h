#ifndef TASK_H
#define TASK_H

#include <string>
#include <chrono>
#include <functional>
#include <thread>
#include <utility>
#include <cstdint>

enum class TaskStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED
};

/**
 * @brief Unit of work queued on a ThreadPool together with its timing metrics.
 */
struct Task {
    uint64_t task_id{0};
    TaskStatus status{TaskStatus::PENDING};
    std::function<void()> func;

    std::string task_name;
    std::string pool_name;
    std::thread::id executing_thread_id;

    std::chrono::steady_clock::time_point enqueue_time;
    std::chrono::steady_clock::time_point start_processing_time;

    uint64_t wait_duration_ns{0}; // enqueue -> start
    uint64_t execution_duration_ns{0}; // start -> end

    Task() = default;

    Task(uint64_t id, std::string name, std::function<void()> fn)
        : task_id(id),
          func(std::move(fn)),
          task_name(std::move(name)),
          enqueue_time(std::chrono::steady_clock::now()) {
    }

    /**
     * @brief Bytes charged against the owning queue while the task waits.
     */
    [[nodiscard]] size_t getMemoryUsage() const {
        return sizeof(*this) + task_name.capacity() + pool_name.capacity();
    }

    void setProcessingStarted() {
        start_processing_time = std::chrono::steady_clock::now();
        wait_duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            start_processing_time - enqueue_time).count());
        executing_thread_id = std::this_thread::get_id();
        status = TaskStatus::PROCESSING;
    }

    void setProcessingEnded(TaskStatus final_status) {
        execution_duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_processing_time).count());
        status = final_status;
    }
};

#endif // TASK_H
