#ifndef ROW_PROCESSOR_H
#define ROW_PROCESSOR_H

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "GridTypes.h"
#include "CellSink.h"
#include "ProgressTracker.h"
#include "ResourceReclaimer.h"

class BitmapImage;

/**
 * @brief Compute the writes of one image row (1-based).
 *
 * Pixel index is (row - 1) * width + (column - 1). Columns past
 * image.decodedColumns(row - 1) hold no decoded data; they are not read
 * and are added to skipped instead.
 *
 * @param columns Letters for columns 1..width, see columnLetterTable().
 */
RowBatch buildRowBatch(const BitmapImage &image, uint32_t row, const std::vector<std::string> &columns,
                       uint64_t &skipped);

struct RowProcessingStats {
    uint64_t cellsWritten{0};
    uint64_t failedWrites{0};
    uint64_t skippedPixels{0};
    uint64_t rowsProcessed{0};
    size_t peakChannelDepth{0};
};

/**
 * @brief Fans image rows out to worker threads and funnels every sink call through the calling thread.
 *
 * Producers are ThreadPool tasks, one per row, that build a RowBatch and push
 * it into a bounded channel (blocking while it is full). The caller's thread
 * is the single consumer: it owns the sink, performs all writes, reports
 * progress and feeds the reclaimer. A CellWriteError skips only that cell;
 * any other failure stops producers and consumer and is rethrown from run().
 */
class RowProcessor {
public:
    /**
     * @param worker_threads Producer threads; 0 uses the ResourceManager thread ceiling.
     * @param channel_capacity Row batches in flight between producers and the consumer.
     */
    explicit RowProcessor(size_t worker_threads = 0, size_t channel_capacity = 64);

    /**
     * @brief Write every pixel of image to sink once.
     *
     * The sink must already be prepared by the calling thread.
     */
    RowProcessingStats run(const BitmapImage &image, CellSink &sink, ProgressTracker &progress,
                           ResourceReclaimer &reclaimer);

    // Per-cell failures logged individually before only the count is kept
    static constexpr uint64_t MAX_LOGGED_FAILURES = 100;

private:
    size_t worker_threads_;
    size_t channel_capacity_;
};

#endif // ROW_PROCESSOR_H
