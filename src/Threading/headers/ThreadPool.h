#ifndef THREAD_POOL_H
#define THREAD_POOL_H

#include <utility>
#include <vector>
#include <thread>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <string>
#include <stdexcept>
#include <chrono>
#include <unordered_map>
#include <future>
#include <limits>
#include <memory>
#include <type_traits>

#include "../../Debug/headers/LogMacros.h"
#include "../../Queue/headers/ThreadSafeQueue.h"
#include "../../Tasks/headers/Task.h"
#include "ResourceManager.h"

struct ThreadMetrics {
    std::thread::id thread_id; // Native thread ID
    std::string pool_name; // Name of the pool this thread belongs to
    std::chrono::system_clock::time_point registration_time; // When the thread was registered/started

    size_t tasks_completed{0}; // Number of tasks completed by this thread
    uint64_t total_execution_time_ns{0}; // Total time spent executing tasks (nanoseconds)
    uint64_t total_wait_time_ns{0}; // Total time tasks waited in the queue before this thread took them
    uint64_t max_execution_time_ns{0}; // Max execution time for a single task
    uint64_t min_execution_time_ns{std::numeric_limits<uint64_t>::max()};

    bool is_executing{false}; // True if the thread is currently executing a task
    std::string current_task_name; // Name of the task currently being executed (if any)

    ThreadMetrics() = default;

    ThreadMetrics(std::thread::id id, std::string p_name)
        : thread_id(id), pool_name(std::move(p_name)), registration_time(std::chrono::system_clock::now()) {
    }
};


class ThreadPool {
public:
    /**
     * @brief Constructs a ThreadPool.
     *
     * @param num_threads Number of threads to create. 0 picks the ResourceManager thread ceiling.
     * @param queue_size Maximum size of the task queue; submit() blocks while it is full.
     * @param pool_name Name of the thread pool for logging and identification.
     */
    explicit ThreadPool(size_t num_threads = 0, size_t queue_size = 100,
                        const std::string &pool_name = "ThreadPool");

    /**
     * @brief Destructor. Stops all threads and waits for them to complete.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /**
     * @brief Stop accepting tasks and join the workers.
     *
     * @param wait_for_completion Run every queued task first; otherwise queued tasks are dropped.
     */
    void shutdown(bool wait_for_completion = true);

    bool is_shutting_down() const;

    size_t size() const;

    /**
     * @brief Block until the queue is empty and no task is executing.
     */
    void wait_for_tasks();

    const std::string &name() const;

    /**
     * @brief Submits a task to be executed by the thread pool and returns a future.
     *
     * @tparam F Type of the function/callable.
     * @tparam Args Types of the arguments to the function.
     * @param task_name Name of the task for metrics and logging.
     * @param task_id Unique ID for the task. If 0, one will be generated.
     * @param f The function/callable to execute.
     * @param args Arguments to pass to the function.
     * @return Future representing the result of the task.
     */
    template<typename F, typename... Args>
    auto submit(std::string task_name, uint64_t task_id, F &&f, Args &&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /**
     * @brief Submits a task with a generated ID and default name, returns a future.
     */
    template<typename F, typename... Args>
    auto submit(F &&f, Args &&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    size_t get_queue_size() const;

    /**
     * @brief Logs a performance summary of the pool to the "ThreadPool" buffer.
     *
     * @param detailed If true, adds one line per worker thread.
     */
    void print_performance_metrics(bool detailed = false) const;

    std::vector<ThreadMetrics> get_thread_metrics() const;

    size_t get_tasks_submitted_count() const;

    size_t get_tasks_completed_count() const;

    size_t get_tasks_failed_count() const;

    size_t get_peak_active_tasks() const;

    uint64_t get_total_pool_execution_time_ns() const;

    uint64_t get_total_pool_wait_time_ns() const;

private:
    void worker_thread(size_t index);

    void record_task_completion(const Task &task);

    uint64_t generate_task_id() {
        return next_task_id_.fetch_add(1, std::memory_order_relaxed);
    }

    std::vector<std::thread> workers_;
    std::unique_ptr<ThreadSafeQueue<std::unique_ptr<Task> > > tasks_;
    std::string pool_name_;

    size_t num_threads_;
    std::atomic<bool> shutdown_{false};
    std::atomic<uint64_t> next_task_id_{1};

    std::mutex pool_mutex_; // Guards workers_ and pairs with cv_all_tasks_done_
    std::condition_variable cv_all_tasks_done_;

    std::unordered_map<std::thread::id, ThreadMetrics> thread_metrics_;
    mutable std::mutex thread_metrics_mutex_;

    std::atomic<size_t> currently_active_tasks_{0}; // Tasks enqueued + processing
    std::atomic<size_t> peak_active_tasks_{0};
    std::atomic<size_t> tasks_submitted_count_{0};
    std::atomic<size_t> tasks_completed_count_{0};
    std::atomic<size_t> tasks_failed_count_{0};
    std::atomic<uint64_t> total_pool_execution_time_ns_{0};
    std::atomic<uint64_t> total_pool_wait_time_ns_{0};
};

template<typename F, typename... Args>
auto ThreadPool::submit(std::string task_name, uint64_t task_id, F &&f, Args &&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto packaged_task = std::make_shared<std::packaged_task<return_type()> >(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<return_type> res = packaged_task->get_future();

    uint64_t final_task_id = (task_id == 0) ? generate_task_id() : task_id;
    auto task = std::make_unique<Task>(final_task_id, std::move(task_name),
                                       [packaged_task]() { (*packaged_task)(); });
    task->pool_name = pool_name_;

    // Reject if the task itself exceeds the global limit
    size_t task_memory = task->getMemoryUsage();
    size_t max_memory = ResourceManager::getInstance().getMaxMemory();
    if (task_memory > max_memory) {
        LOG_WARN("ThreadPool", "Pool '" + pool_name_ + "' Task '" + task->task_name + "' (ID: " +
                               std::to_string(final_task_id) + "): Rejected due to memory limit. Task size: " +
                               std::to_string(task_memory) + " bytes, Limit: " + std::to_string(max_memory) + " bytes.");
        std::promise<return_type> promise;
        promise.set_exception(std::make_exception_ptr(
            std::runtime_error("Task rejected - individual task exceeds max memory")));
        return promise.get_future();
    }

    if (shutdown_.load(std::memory_order_acquire)) {
        LOG_ERR("ThreadPool", "Pool '" + pool_name_ + "' Task '" + task->task_name + "' (ID: " +
                              std::to_string(final_task_id) + "): Attempted to submit to a shutdown pool.");
        throw std::runtime_error("ThreadPool: submit called on a stopped ThreadPool");
    }

    tasks_submitted_count_.fetch_add(1, std::memory_order_relaxed);

    // Increment active tasks before pushing to the queue
    size_t new_current_active = currently_active_tasks_.fetch_add(1, std::memory_order_acq_rel) + 1;
    size_t current_peak = peak_active_tasks_.load(std::memory_order_relaxed);
    while (new_current_active > current_peak &&
           !peak_active_tasks_.compare_exchange_weak(current_peak, new_current_active)) {
    }

    // Blocks while the queue is full
    if (!tasks_->push(std::move(task))) {
        currently_active_tasks_.fetch_sub(1, std::memory_order_acq_rel);
        cv_all_tasks_done_.notify_all();

        std::promise<return_type> promise;
        promise.set_exception(std::make_exception_ptr(
            std::runtime_error("Failed to push task to queue (pool shutting down)")));
        return promise.get_future();
    }

    return res;
}

template<typename F, typename... Args>
auto ThreadPool::submit(F &&f, Args &&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submit("UnnamedTask", 0, std::forward<F>(f), std::forward<Args>(args)...);
}

#endif // THREAD_POOL_H
