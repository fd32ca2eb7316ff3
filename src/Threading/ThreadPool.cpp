#include "headers/ThreadPool.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {
    // Helper to format duration in nanoseconds to a human-readable string
    std::string formatDurationNs(uint64_t ns) {
        if (ns == std::numeric_limits<uint64_t>::max()) return "N/A";

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        if (ns < 1000) {
            oss << ns << " ns";
        } else if (ns < 1000000) {
            oss << static_cast<double>(ns) / 1000.0 << " us";
        } else if (ns < 1000000000) {
            oss << static_cast<double>(ns) / 1000000.0 << " ms";
        } else {
            oss << static_cast<double>(ns) / 1000000000.0 << " s";
        }
        return oss.str();
    }

    std::string shortThreadId(std::thread::id id) {
        std::hash<std::thread::id> hasher;
        return std::to_string(hasher(id) % 100000);
    }
}

ThreadPool::ThreadPool(size_t num_threads, size_t queue_size, const std::string &pool_name)
    : pool_name_(pool_name),
      num_threads_(num_threads == 0 ? ResourceManager::getInstance().getMaxThreads() : num_threads) {
    num_threads_ = std::max<size_t>(num_threads_, 1);
    tasks_ = std::make_unique<ThreadSafeQueue<std::unique_ptr<Task> > >(queue_size, pool_name + "_tasks");

    LOG_DBG("ThreadPool", "Initializing ThreadPool '" + pool_name_ + "' with " + std::to_string(num_threads_) +
                          " threads. Task queue max size: " + std::to_string(queue_size));

    workers_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::worker_thread, this, i);
    }
}

ThreadPool::~ThreadPool() {
    shutdown(false);
}

void ThreadPool::shutdown(bool wait_for_completion) {
    if (shutdown_.exchange(true)) {
        // Another caller already stopped the pool; make sure its workers are joined
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        return;
    }
    LOG_INF("ThreadPool", "Stopping ThreadPool '" + pool_name_ + "'. Wait for completion: " +
                          (wait_for_completion ? "true" : "false"));

    if (wait_for_completion) {
        wait_for_tasks();
    } else {
        // Only tasks removed here are uncounted; a worker that popped first decrements its own
        const size_t dropped = tasks_->clear();
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            currently_active_tasks_.fetch_sub(dropped, std::memory_order_acq_rel);
        }
        cv_all_tasks_done_.notify_all();
    }
    tasks_->shutdown(); // Wake up idle workers so they can exit

    std::vector<std::thread> threads_to_join; {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        threads_to_join.swap(workers_);
    }
    for (auto &worker : threads_to_join) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    LOG_INF("ThreadPool", "ThreadPool '" + pool_name_ + "' fully stopped. Tasks completed: " +
                          std::to_string(tasks_completed_count_.load()) + ", failed: " +
                          std::to_string(tasks_failed_count_.load()));
}

bool ThreadPool::is_shutting_down() const {
    return shutdown_.load(std::memory_order_acquire);
}

size_t ThreadPool::size() const {
    return num_threads_;
}

const std::string &ThreadPool::name() const {
    return pool_name_;
}

void ThreadPool::wait_for_tasks() {
    std::unique_lock<std::mutex> lock(pool_mutex_);
    cv_all_tasks_done_.wait(lock, [this] {
        return currently_active_tasks_.load(std::memory_order_acquire) == 0;
    });
}

void ThreadPool::worker_thread(size_t index) {
    std::thread::id native_id = std::this_thread::get_id();
    ResourceManager::getInstance().registerThread(pool_name_);
    {
        std::lock_guard<std::mutex> lock(thread_metrics_mutex_);
        thread_metrics_[native_id] = ThreadMetrics(native_id, pool_name_);
    }

    std::string worker_label = "[" + pool_name_ + "-" + std::to_string(index) + "/" + shortThreadId(native_id) + "]";
    LOG_DBG("ThreadPool", "Worker thread " + worker_label + " started.");

    std::unique_ptr<Task> taskPtr;
    // pop() returns false only once the queue is shut down and drained
    while (tasks_->pop(taskPtr)) {
        Task &task = *taskPtr;
        task.setProcessingStarted();

        {
            std::lock_guard<std::mutex> lock(thread_metrics_mutex_);
            auto it = thread_metrics_.find(native_id);
            if (it != thread_metrics_.end()) {
                it->second.is_executing = true;
                it->second.current_task_name = task.task_name;
            }
        }

        try {
            if (task.func) {
                task.func();
            }
            task.setProcessingEnded(TaskStatus::COMPLETED);
        } catch (const std::exception &e) {
            // packaged_task stores exceptions in the future; this only catches failures of the wrapper itself
            task.setProcessingEnded(TaskStatus::FAILED);
            LOG_ERR("ThreadPool", "Worker thread " + worker_label + " task '" + task.task_name + "' (ID: " +
                                  std::to_string(task.task_id) + ") threw exception: " + e.what());
        }

        record_task_completion(task);
        taskPtr.reset();

        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            currently_active_tasks_.fetch_sub(1, std::memory_order_acq_rel);
        }
        cv_all_tasks_done_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(thread_metrics_mutex_);
        auto it = thread_metrics_.find(native_id);
        if (it != thread_metrics_.end()) {
            it->second.is_executing = false;
        }
    }
    ResourceManager::getInstance().unregisterThread();
    LOG_DBG("ThreadPool", "Worker thread " + worker_label + " finished.");
}

void ThreadPool::record_task_completion(const Task &task) {
    if (task.status == TaskStatus::COMPLETED) {
        tasks_completed_count_.fetch_add(1, std::memory_order_relaxed);
    } else if (task.status == TaskStatus::FAILED) {
        tasks_failed_count_.fetch_add(1, std::memory_order_relaxed);
    }
    total_pool_execution_time_ns_.fetch_add(task.execution_duration_ns, std::memory_order_relaxed);
    total_pool_wait_time_ns_.fetch_add(task.wait_duration_ns, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(thread_metrics_mutex_);
    auto it = thread_metrics_.find(task.executing_thread_id);
    if (it == thread_metrics_.end()) {
        return;
    }
    ThreadMetrics &metrics = it->second;
    metrics.tasks_completed++;
    metrics.total_execution_time_ns += task.execution_duration_ns;
    metrics.total_wait_time_ns += task.wait_duration_ns;
    metrics.max_execution_time_ns = std::max(metrics.max_execution_time_ns, task.execution_duration_ns);
    metrics.min_execution_time_ns = std::min(metrics.min_execution_time_ns, task.execution_duration_ns);
    metrics.is_executing = false;
    metrics.current_task_name.clear();
}

size_t ThreadPool::get_queue_size() const {
    return tasks_->size();
}

size_t ThreadPool::get_tasks_submitted_count() const {
    return tasks_submitted_count_.load(std::memory_order_relaxed);
}

size_t ThreadPool::get_tasks_completed_count() const {
    return tasks_completed_count_.load(std::memory_order_relaxed);
}

size_t ThreadPool::get_tasks_failed_count() const {
    return tasks_failed_count_.load(std::memory_order_relaxed);
}

size_t ThreadPool::get_peak_active_tasks() const {
    return peak_active_tasks_.load(std::memory_order_relaxed);
}

uint64_t ThreadPool::get_total_pool_execution_time_ns() const {
    return total_pool_execution_time_ns_.load(std::memory_order_relaxed);
}

uint64_t ThreadPool::get_total_pool_wait_time_ns() const {
    return total_pool_wait_time_ns_.load(std::memory_order_relaxed);
}

std::vector<ThreadMetrics> ThreadPool::get_thread_metrics() const {
    std::lock_guard<std::mutex> lock(thread_metrics_mutex_);
    std::vector<ThreadMetrics> result;
    result.reserve(thread_metrics_.size());
    for (const auto &pair : thread_metrics_) {
        result.push_back(pair.second);
    }
    return result;
}

void ThreadPool::print_performance_metrics(bool detailed) const {
    std::ostringstream oss;
    oss << "--- ThreadPool Performance Report for '" << pool_name_ << "' ---\n";
    oss << "Threads: " << num_threads_
        << ", Peak Active Tasks: " << get_peak_active_tasks() << "\n";
    oss << "Tasks Submitted: " << get_tasks_submitted_count()
        << ", Completed: " << get_tasks_completed_count()
        << ", Failed: " << get_tasks_failed_count() << "\n";
    oss << "Total Pool Execution Time: " << formatDurationNs(get_total_pool_execution_time_ns()) << "\n";
    oss << "Total Pool Wait Time: " << formatDurationNs(get_total_pool_wait_time_ns());

    if (detailed) {
        for (const auto &tm : get_thread_metrics()) {
            oss << "\n  Thread [" << tm.pool_name << "-" << shortThreadId(tm.thread_id) << "]"
                << " tasks: " << tm.tasks_completed
                << ", exec: " << formatDurationNs(tm.total_execution_time_ns)
                << ", avg: " << formatDurationNs(tm.tasks_completed == 0 ? 0 : tm.total_execution_time_ns / tm.tasks_completed)
                << ", min: " << formatDurationNs(tm.min_execution_time_ns)
                << ", max: " << formatDurationNs(tm.max_execution_time_ns)
                << ", wait: " << formatDurationNs(tm.total_wait_time_ns);
        }
    }

    LOG_INF("ThreadPool", oss.str());
}
