#pragma once

#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>
#include <vector>
#include <string>
#include <cstdint>
#include "../../Debug/headers/MemoryTypes.h" // shared types
#include "../../Debug/headers/LogMacros.h" // logging macros

/**
 * A class to handle thread and memory limitations.
 * This singleton class provides the ability to:
 * 1. Limit the number of threads used by the program
 * 2. Track and limit memory usage across operations
 * 3. Pool raw byte blocks for reuse and release idle ones on demand (collect)
 */
class ResourceManager {
public:
    static constexpr size_t NUM_SIZE_BUCKETS = 40; // 2^39 bytes is the largest block
    static constexpr size_t MIN_POOL_BLOCK_SIZE = 8;
    static constexpr size_t MIN_MAX_MEMORY = 64ull * 1024 * 1024;

    using MemoryBlockCategory = memory::MemoryBlockCategory;
    using MemoryBlockId = memory::MemoryBlockId;

    /**
     * @brief Get the singleton instance of the ResourceManager.
     */
    static ResourceManager &getInstance();

    ~ResourceManager();

    ResourceManager(const ResourceManager &) = delete;
    ResourceManager &operator=(const ResourceManager &) = delete;

    /**
     * @brief Register the calling thread as a worker of pool_name.
     */
    void registerThread(const std::string &pool_name);

    void unregisterThread();

    size_t getMaxThreads() const;

    size_t getActiveThreadCount() const;

    size_t getPeakActiveThreadCount() const;

    /**
     * @brief Set the maximum number of threads (at least 1).
     */
    void setMaxThreads(size_t threads);

    /**
     * @brief Set the maximum memory usage in bytes (at least MIN_MAX_MEMORY).
     */
    void setMaxMemory(size_t memory_bytes);

    size_t getMaxMemory() const;

    size_t getCurrentMemoryUsage() const;

    size_t getPeakMemoryUsage() const;

    /**
     * @brief Bytes held by pooled blocks that are currently not in use.
     */
    size_t getIdlePooledBytes() const;

    /**
     * @brief Manual accounting for memory owned outside the pool.
     */
    void increaseMemory(size_t bytes);

    void decreaseMemory(size_t bytes);

    /**
     * @brief Get memory from the pool if available, otherwise allocate new memory.
     *
     * Waits up to allocation_timeout for memory to be returned when the
     * ceiling would be exceeded; idle pooled blocks are collected first.
     *
     * @param bytes Number of bytes needed.
     * @param category Category for this memory allocation.
     * @return ID of the memory block, or an invalid ID if allocation failed.
     */
    MemoryBlockId getPooledMemory(size_t bytes, MemoryBlockCategory category = MemoryBlockCategory::GENERIC);

    /**
     * @brief Return a block to the pool for reuse; the memory stays allocated until collect().
     *
     * @return True if successful, false if invalid block ID.
     */
    bool releasePooledMemory(MemoryBlockId block_id);

    void *getMemoryPtr(MemoryBlockId block_id);

    size_t getMemorySize(MemoryBlockId block_id);

    /**
     * @brief Collection point: free every pooled block that is not in use.
     *
     * @return Number of bytes returned to the system.
     */
    size_t collect();

    /**
     * @brief Number of collect() calls since startup.
     */
    size_t getCollectionCount() const;

    void setAllocationTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Log current memory and pool status to the "ResourceManager" buffer.
     */
    void printMemoryStatus();

    static std::string formatMemorySize(size_t bytes);

    static std::string categoryToString(MemoryBlockCategory category);

    /**
     * @brief Find the power-of-two bucket that holds the requested size.
     */
    static uint8_t getSizeBucketForSize(size_t bytes);

    static size_t getSizeForBucket(uint8_t bucket);

private:
    ResourceManager();

    struct MemoryPoolBlock {
        void *memory_ptr{nullptr};
        size_t actual_size{0};
        std::chrono::steady_clock::time_point timestamp;
        bool in_use{false};
    };

    struct PoolBucket {
        std::vector<MemoryPoolBlock> blocks;
        std::vector<uint32_t> free_indices; // Slots not in use (their memory may already be collected)
        std::mutex bucket_mutex;

        size_t hits{0}; // Reused an allocated idle block
        size_t misses{0}; // Needed a fresh allocation
    };

    // pools_[category][size_bucket]
    std::vector<std::vector<std::unique_ptr<PoolBucket> > > pools_;

    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> peak_active_threads_{0};
    std::atomic<size_t> max_threads_;

    std::atomic<size_t> current_memory_usage_{0};
    std::atomic<size_t> peak_memory_usage_{0};
    std::atomic<size_t> idle_pooled_bytes_{0};
    std::atomic<size_t> max_memory_usage_{1024ull * 1024 * 1024}; // default 1GB
    std::atomic<size_t> collection_count_{0};
    std::chrono::milliseconds allocation_timeout_{5000};
    std::mutex memory_mutex_;
    std::condition_variable memory_cv_;

    PoolBucket *bucketFor(MemoryBlockId block_id);

    bool reserveMemory(size_t bytes);
};
