#ifndef RESOURCE_RECLAIMER_H
#define RESOURCE_RECLAIMER_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include "CellSink.h"

/**
 * @brief Backpressure valve against per-write resources piling up in the sink.
 *
 * Counts writes since the last reclamation. Once the count exceeds the
 * threshold, it clears sink formatting for the rows that are fully written
 * and not yet cleared, runs a collection point, and resets the count.
 * Rows finish out of order; only the contiguous prefix 1..N of finished
 * rows is ever cleared.
 */
class ResourceReclaimer {
public:
    using CollectFn = std::function<size_t()>;

    /**
     * @param sink Sink whose formatting state is cleared; must outlive the reclaimer.
     * @param threshold Writes allowed between reclamations (> 0).
     * @param collect Collection point; defaults to ResourceManager::collect().
     * @throws std::invalid_argument if threshold is 0.
     */
    ResourceReclaimer(CellSink &sink, uint64_t threshold, CollectFn collect = {});

    /**
     * @brief Record that row has been completely written with writes cells.
     * @return True if this call triggered a reclamation.
     */
    bool rowCompleted(uint32_t row, uint64_t writes);

    [[nodiscard]] uint64_t pendingWrites() const { return writes_since_reclaim_.load(); }
    [[nodiscard]] uint64_t reclamations() const { return reclamations_.load(); }
    [[nodiscard]] uint64_t bytesReleased() const { return bytes_released_.load(); }
    [[nodiscard]] uint64_t threshold() const { return threshold_; }

    /**
     * @brief Highest row N such that rows 1..N are all written.
     */
    [[nodiscard]] uint32_t completedThrough() const;

    [[nodiscard]] uint32_t lastClearedRow() const;

private:
    CellSink &sink_;
    const uint64_t threshold_;
    CollectFn collect_;

    std::atomic<uint64_t> writes_since_reclaim_{0};
    std::atomic<uint64_t> reclamations_{0};
    std::atomic<uint64_t> bytes_released_{0};

    mutable std::mutex rows_mutex_;
    uint32_t completed_through_{0};
    uint32_t last_cleared_{0};
    std::set<uint32_t> finished_ahead_; // finished rows above completed_through_

    void reclaim();
};

#endif // RESOURCE_RECLAIMER_H
