#include "headers/RowProcessor.h"
#include <exception>
#include <mutex>
#include <thread>
#include "headers/ColumnAddress.h"
#include "headers/GridErrors.h"
#include "../Image/headers/BitmapImage.h"
#include "../Queue/headers/ThreadSafeQueue.h"
#include "../Threading/headers/ThreadPool.h"
#include "../Debug/headers/LogMacros.h"

RowBatch buildRowBatch(const BitmapImage &image, uint32_t row, const std::vector<std::string> &columns,
                       uint64_t &skipped) {
    const auto width = static_cast<uint32_t>(image.getWidth());
    const auto decoded = static_cast<uint32_t>(image.decodedColumns(static_cast<int>(row - 1)));
    const size_t row_start = static_cast<size_t>(row - 1) * width;

    RowBatch batch;
    batch.row = row;
    batch.writes.reserve(decoded);
    // Decoder delivered fewer pixels than width*height; the rest of this row has no data
    skipped += width - decoded;
    for (uint32_t col = 1; col <= decoded; ++col) {
        const Rgb pixel = image.getPixel(row_start + (col - 1));
        batch.writes.push_back(CellWrite{CellAddress{columns[col - 1], row}, pixel.r, pixel.g, pixel.b});
    }
    return batch;
}

RowProcessor::RowProcessor(size_t worker_threads, size_t channel_capacity)
    : worker_threads_(worker_threads), channel_capacity_(channel_capacity > 0 ? channel_capacity : 1) {
}

RowProcessingStats RowProcessor::run(const BitmapImage &image, CellSink &sink, ProgressTracker &progress,
                                     ResourceReclaimer &reclaimer) {
    RowProcessingStats stats;
    const auto width = static_cast<uint32_t>(image.getWidth());
    const auto height = static_cast<uint32_t>(image.getHeight());
    if (width == 0 || height == 0) {
        return stats;
    }

    const std::vector<std::string> columns = columnLetterTable(width);
    ThreadSafeQueue<RowBatch> channel(channel_capacity_, "RowChannel");
    std::atomic<bool> abort{false};
    std::atomic<uint64_t> skipped{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    // First fatal error wins; closing the channel unblocks producers and consumer
    auto fail = [&](std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) {
                first_error = std::move(error);
            }
        }
        abort.store(true);
        channel.shutdown();
    };

    ThreadPool producers(worker_threads_, channel_capacity_, "RowProducers");
    LOG_INF("RowProcessor", "Processing " + std::to_string(height) + " rows of " + std::to_string(width) +
            " cells with " + std::to_string(producers.size()) + " producer threads");

    // Feeds the pool so the consumer never blocks on a full task queue
    std::thread dispatcher([&]() {
        try {
            for (uint32_t row = 1; row <= height && !abort.load(); ++row) {
                producers.submit("row-" + std::to_string(row), row, [&, row]() {
                    if (abort.load()) {
                        return;
                    }
                    try {
                        uint64_t row_skipped = 0;
                        RowBatch batch = buildRowBatch(image, row, columns, row_skipped);
                        skipped += row_skipped;
                        if (!channel.push(std::move(batch))) {
                            LOG_DBG("RowProcessor", "Row " + std::to_string(row) + " dropped, channel closed");
                        }
                    } catch (...) {
                        fail(std::current_exception());
                    }
                });
            }
        } catch (...) {
            fail(std::current_exception());
        }
        producers.shutdown(!abort.load());
        channel.shutdown();
    });

    RowBatch batch;
    while (!abort.load() && channel.pop(batch)) {
        try {
            for (const auto &write: batch.writes) {
                try {
                    sink.setCellColor(write.address, write.r, write.g, write.b);
                    ++stats.cellsWritten;
                } catch (const CellWriteError &e) {
                    ++stats.failedWrites;
                    if (stats.failedWrites <= MAX_LOGGED_FAILURES) {
                        LOG_WARN("RowProcessor", std::string("Cell write failed: ") + e.what());
                    }
                }
            }
            ++stats.rowsProcessed;
            progress.report(width);
            reclaimer.rowCompleted(batch.row, batch.writes.size());
        } catch (...) {
            fail(std::current_exception());
        }
    }

    dispatcher.join();
    producers.print_performance_metrics(false);

    stats.skippedPixels = skipped.load();
    stats.peakChannelDepth = channel.high_water_mark();

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    if (stats.failedWrites > MAX_LOGGED_FAILURES) {
        LOG_WARN("RowProcessor", std::to_string(stats.failedWrites - MAX_LOGGED_FAILURES) +
                 " further cell write failures not logged individually");
    }
    return stats;
}
