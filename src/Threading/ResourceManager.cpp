#include "headers/ResourceManager.h"
#include "../Debug/headers/Debug.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <iomanip>
#include <iterator>

namespace {
    std::string threadIdToString(const std::thread::id &id) {
        std::ostringstream oss;
        oss << id;
        return oss.str();
    }

    void updatePeak(std::atomic<size_t> &peak, size_t value) {
        size_t prev = peak.load(std::memory_order_relaxed);
        while (value > prev && !peak.compare_exchange_weak(prev, value, std::memory_order_relaxed)) {
        }
    }
}

ResourceManager &ResourceManager::getInstance() {
    static ResourceManager instance;
    return instance;
}

ResourceManager::ResourceManager()
    : max_threads_(std::max<size_t>(1, std::thread::hardware_concurrency())) {
    pools_.resize(memory::MEMORY_CATEGORY_COUNT);
    for (auto &categoryBuckets: pools_) {
        categoryBuckets.resize(NUM_SIZE_BUCKETS);
        for (auto &bucket: categoryBuckets) {
            bucket = std::make_unique<PoolBucket>();
        }
    }
}

ResourceManager::~ResourceManager() {
    for (auto &categoryBuckets: pools_) {
        for (auto &pool: categoryBuckets) {
            std::lock_guard<std::mutex> lock(pool->bucket_mutex);
            for (auto &block: pool->blocks) {
                std::free(block.memory_ptr);
                block.memory_ptr = nullptr;
            }
            pool->blocks.clear();
            pool->free_indices.clear();
        }
    }
}

std::string ResourceManager::formatMemorySize(size_t bytes) {
    return formatDataSize(bytes);
}

std::string ResourceManager::categoryToString(MemoryBlockCategory category) {
    switch (category) {
        case MemoryBlockCategory::GENERIC: return "Generic";
        case MemoryBlockCategory::IMAGE: return "Image";
        case MemoryBlockCategory::GRID: return "Grid";
        default: return "Unknown";
    }
}

uint8_t ResourceManager::getSizeBucketForSize(size_t bytes) {
    if (bytes < MIN_POOL_BLOCK_SIZE) bytes = MIN_POOL_BLOCK_SIZE;

    // Smallest power of two >= bytes: 8, 16, 32, ... 1K, 2K, ...
    uint8_t bucket = 0;
    while (bucket < NUM_SIZE_BUCKETS - 1 && (static_cast<size_t>(1) << bucket) < bytes) {
        ++bucket;
    }
    return bucket;
}

size_t ResourceManager::getSizeForBucket(uint8_t bucket) {
    bucket = std::min(bucket, static_cast<uint8_t>(NUM_SIZE_BUCKETS - 1));
    return static_cast<size_t>(1) << bucket;
}

// Thread management methods
void ResourceManager::registerThread(const std::string &pool_name) {
    size_t active = active_threads_.fetch_add(1) + 1;
    updatePeak(peak_active_threads_, active);

    LOG_DBG("ResourceManager", "Thread " + threadIdToString(std::this_thread::get_id()) +
            " from pool '" + pool_name + "' registered. Active threads: " + std::to_string(active));
}

void ResourceManager::unregisterThread() {
    size_t active = active_threads_.load();
    while (active > 0 && !active_threads_.compare_exchange_weak(active, active - 1)) {
    }

    LOG_DBG("ResourceManager", "Thread " + threadIdToString(std::this_thread::get_id()) +
            " unregistered. Active threads: " + std::to_string(active_threads_.load()));
}

size_t ResourceManager::getMaxThreads() const {
    return max_threads_.load();
}

size_t ResourceManager::getActiveThreadCount() const {
    return active_threads_.load(std::memory_order_relaxed);
}

size_t ResourceManager::getPeakActiveThreadCount() const {
    return peak_active_threads_.load(std::memory_order_relaxed);
}

void ResourceManager::setMaxThreads(size_t threads) {
    max_threads_ = (threads > 0) ? threads : 1;
    LOG_DBG("ResourceManager", "Max threads set to " + std::to_string(max_threads_.load()));
}

void ResourceManager::setMaxMemory(size_t memory_bytes) {
    max_memory_usage_ = std::max(memory_bytes, MIN_MAX_MEMORY);
    LOG_DBG("ResourceManager", "Max memory set to " + formatMemorySize(max_memory_usage_.load()));
    memory_cv_.notify_all();
}

size_t ResourceManager::getMaxMemory() const {
    return max_memory_usage_.load();
}

size_t ResourceManager::getCurrentMemoryUsage() const {
    return current_memory_usage_.load();
}

size_t ResourceManager::getPeakMemoryUsage() const {
    return peak_memory_usage_.load();
}

size_t ResourceManager::getIdlePooledBytes() const {
    return idle_pooled_bytes_.load();
}

size_t ResourceManager::getCollectionCount() const {
    return collection_count_.load();
}

void ResourceManager::setAllocationTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    allocation_timeout_ = timeout;
}

// Manual memory accounting helpers
void ResourceManager::increaseMemory(size_t bytes) {
    if (bytes == 0) return;
    size_t new_val = current_memory_usage_.fetch_add(bytes) + bytes;
    updatePeak(peak_memory_usage_, new_val);
}

void ResourceManager::decreaseMemory(size_t bytes) {
    if (bytes == 0) return;
    size_t current = current_memory_usage_.load();
    size_t next;
    do {
        next = current >= bytes ? current - bytes : 0;
    } while (!current_memory_usage_.compare_exchange_weak(current, next));
    memory_cv_.notify_all();
}

bool ResourceManager::reserveMemory(size_t bytes) {
    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(memory_mutex_);
        deadline = std::chrono::steady_clock::now() + allocation_timeout_;
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(memory_mutex_);
            if (current_memory_usage_.load() + bytes <= max_memory_usage_.load()) {
                increaseMemory(bytes);
                return true;
            }
        }

        // Idle blocks are the cheapest memory to give back
        if (idle_pooled_bytes_.load() > 0 && collect() > 0) {
            continue;
        }

        std::unique_lock<std::mutex> lock(memory_mutex_);
        bool fits = memory_cv_.wait_until(lock, deadline, [this, bytes]() {
            return current_memory_usage_.load() + bytes <= max_memory_usage_.load() ||
                   idle_pooled_bytes_.load() > 0;
        });
        if (!fits) {
            LOG_WARN("ResourceManager", "Memory reservation of " + formatMemorySize(bytes) +
                     " timed out (using " + formatMemorySize(current_memory_usage_.load()) +
                     " of " + formatMemorySize(max_memory_usage_.load()) + ")");
            return false;
        }
    }
}

ResourceManager::PoolBucket *ResourceManager::bucketFor(MemoryBlockId block_id) {
    if (!block_id.isValid()) return nullptr;

    auto cat_index = static_cast<size_t>(block_id.category);
    if (cat_index >= pools_.size() || block_id.size_bucket >= pools_[cat_index].size()) return nullptr;

    return pools_[cat_index][block_id.size_bucket].get();
}

ResourceManager::MemoryBlockId ResourceManager::getPooledMemory(size_t bytes, MemoryBlockCategory category) {
    const uint8_t size_bucket = getSizeBucketForSize(bytes);
    const size_t actual_size = getSizeForBucket(size_bucket);
    if (actual_size < bytes || actual_size > max_memory_usage_.load()) {
        LOG_ERR("ResourceManager", "Request for " + formatMemorySize(bytes) +
                " exceeds the memory ceiling of " + formatMemorySize(max_memory_usage_.load()));
        return {};
    }

    auto cat_index = static_cast<size_t>(category);
    if (cat_index >= pools_.size()) {
        cat_index = 0;
        category = MemoryBlockCategory::GENERIC;
    }
    auto &pool = pools_[cat_index][size_bucket];

    // Reuse an idle block that still holds memory
    {
        std::lock_guard<std::mutex> lock(pool->bucket_mutex);
        for (auto it = pool->free_indices.rbegin(); it != pool->free_indices.rend(); ++it) {
            uint32_t index = *it;
            auto &block = pool->blocks[index];
            if (!block.memory_ptr) continue;

            pool->free_indices.erase(std::next(it).base());
            block.in_use = true;
            block.timestamp = std::chrono::steady_clock::now();
            idle_pooled_bytes_ -= block.actual_size;
            pool->hits++;

            LOG_DBG("ResourceManager", "Reused " + formatMemorySize(actual_size) + " block from " +
                    categoryToString(category) + " pool");
            return MemoryBlockId(index + 1, size_bucket, category); // +1 because 0 is invalid
        }
    }

    if (!reserveMemory(actual_size)) {
        return {};
    }

    void *memory = std::malloc(actual_size);
    if (!memory) {
        decreaseMemory(actual_size);
        LOG_ERR("ResourceManager", "Failed to allocate " + formatMemorySize(actual_size));
        return {};
    }

    std::lock_guard<std::mutex> lock(pool->bucket_mutex);

    MemoryPoolBlock new_block;
    new_block.memory_ptr = memory;
    new_block.actual_size = actual_size;
    new_block.timestamp = std::chrono::steady_clock::now();
    new_block.in_use = true;

    uint32_t index;
    // A collected slot has no memory; it can take the fresh allocation
    auto slot = std::find_if(pool->free_indices.begin(), pool->free_indices.end(), [&pool](uint32_t i) {
        return pool->blocks[i].memory_ptr == nullptr;
    });
    if (slot != pool->free_indices.end()) {
        index = *slot;
        pool->free_indices.erase(slot);
        pool->blocks[index] = new_block;
    } else {
        index = static_cast<uint32_t>(pool->blocks.size());
        pool->blocks.push_back(new_block);
    }
    pool->misses++;

    LOG_DBG("ResourceManager", "Allocated " + formatMemorySize(actual_size) + " for " +
            categoryToString(category) + " usage (total: " +
            formatMemorySize(current_memory_usage_.load()) + ")");

    return MemoryBlockId(index + 1, size_bucket, category);
}

bool ResourceManager::releasePooledMemory(MemoryBlockId block_id) {
    PoolBucket *pool = bucketFor(block_id);
    if (!pool) return false;

    uint32_t index = block_id.pool_index - 1; // adjust for +1 offset
    {
        std::lock_guard<std::mutex> lock(pool->bucket_mutex);
        if (index >= pool->blocks.size()) return false;

        auto &block = pool->blocks[index];
        if (!block.in_use || !block.memory_ptr) return false;

        block.in_use = false;
        block.timestamp = std::chrono::steady_clock::now();
        pool->free_indices.push_back(index);
        idle_pooled_bytes_ += block.actual_size;
    }
    memory_cv_.notify_all();
    return true;
}

void *ResourceManager::getMemoryPtr(MemoryBlockId block_id) {
    PoolBucket *pool = bucketFor(block_id);
    if (!pool) return nullptr;

    uint32_t index = block_id.pool_index - 1;
    std::lock_guard<std::mutex> lock(pool->bucket_mutex);
    if (index >= pool->blocks.size() || !pool->blocks[index].in_use) return nullptr;

    return pool->blocks[index].memory_ptr;
}

size_t ResourceManager::getMemorySize(MemoryBlockId block_id) {
    PoolBucket *pool = bucketFor(block_id);
    if (!pool) return 0;

    uint32_t index = block_id.pool_index - 1;
    std::lock_guard<std::mutex> lock(pool->bucket_mutex);
    if (index >= pool->blocks.size() || !pool->blocks[index].in_use) return 0;

    return pool->blocks[index].actual_size;
}

size_t ResourceManager::collect() {
    size_t released = 0;
    size_t blocks = 0;

    for (auto &categoryBuckets: pools_) {
        for (auto &pool: categoryBuckets) {
            std::lock_guard<std::mutex> lock(pool->bucket_mutex);
            for (uint32_t index: pool->free_indices) {
                auto &block = pool->blocks[index];
                if (!block.memory_ptr) continue;

                std::free(block.memory_ptr);
                block.memory_ptr = nullptr;
                released += block.actual_size;
                idle_pooled_bytes_ -= block.actual_size;
                ++blocks;
            }
        }
    }

    collection_count_++;
    if (released > 0) {
        decreaseMemory(released);
    }

    LOG_MEM("ResourceManager", "Collection released " + std::to_string(blocks) + " idle blocks (" +
            formatMemorySize(released) + "), using " + formatMemorySize(current_memory_usage_.load()));
    return released;
}

void ResourceManager::printMemoryStatus() {
    LOG_MEM("ResourceManager", "Memory Status: Using " + formatMemorySize(current_memory_usage_.load()) +
            " of " + formatMemorySize(max_memory_usage_.load()) + ", peak " +
            formatMemorySize(peak_memory_usage_.load()) + ", idle pooled " +
            formatMemorySize(idle_pooled_bytes_.load()));

    for (size_t cat = 0; cat < pools_.size(); ++cat) {
        size_t total_hits = 0;
        size_t total_misses = 0;
        size_t total_blocks = 0;

        for (auto &pool: pools_[cat]) {
            std::lock_guard<std::mutex> lock(pool->bucket_mutex);
            total_hits += pool->hits;
            total_misses += pool->misses;
            total_blocks += static_cast<size_t>(std::count_if(pool->blocks.begin(), pool->blocks.end(),
                                                              [](const MemoryPoolBlock &b) {
                                                                  return b.memory_ptr != nullptr;
                                                              }));
        }

        if (total_blocks > 0 || total_hits > 0 || total_misses > 0) {
            std::ostringstream oss;
            oss << "  " << categoryToString(static_cast<MemoryBlockCategory>(cat)) << ": "
                << total_blocks << " blocks, " << total_hits << " hits, " << total_misses
                << " misses, hit rate: " << std::fixed << std::setprecision(1)
                << (100.0 * total_hits / static_cast<double>(total_hits + total_misses)) << "%";
            LOG_MEM("ResourceManager", oss.str());
        }
    }
}
