#include "headers/GridConverter.h"
#include <utility>
#include "headers/ColumnAddress.h"
#include "headers/ResourceReclaimer.h"
#include "headers/RowProcessor.h"
#include "headers/SizeAdjuster.h"
#include "../Image/headers/BitmapImage.h"
#include "../Threading/headers/ResourceManager.h"
#include "../Debug/headers/Debug.h"
#include "../Debug/headers/LogMacros.h"

GridConverter::GridConverter(ConverterSettings settings) : settings_(std::move(settings)) {
}

bool GridConverter::validatePixelCount(const BitmapImage &image, ConversionReport &report) {
    report.expectedPixels = static_cast<uint64_t>(image.getWidth()) * static_cast<uint64_t>(image.getHeight());
    report.actualPixels = image.pixelCount();
    report.pixelCountMismatch = report.expectedPixels != report.actualPixels;

    if (report.pixelCountMismatch) {
        const std::string message = "Image pixel count does not match the calculated pixel count (H*W) - expected:" +
                                    std::to_string(report.expectedPixels) + " actual:" +
                                    std::to_string(report.actualPixels);
        printWarning(message);
        LOG_WARN("GridPainter", message);
    }
    return !report.pixelCountMismatch;
}

ConversionReport GridConverter::convert(BitmapImage &image, CellSink &sink) {
    ConversionReport report;
    validatePixelCount(image, report);

    report.targetSize = adjustImageSize(image, settings_.bounds);
    report.rightmostColumn = columnLetters(report.targetSize.cols);
    LOG_INF("GridPainter", "Target grid " + std::to_string(report.targetSize.cols) + "x" +
            std::to_string(report.targetSize.rows) + ", rightmost column " + report.rightmostColumn);

    sink.prepare(report.targetSize);

    printStatus("Converting image...");

    const uint64_t total_pixels = static_cast<uint64_t>(report.targetSize.rows) * report.targetSize.cols;
    ProgressTracker progress(total_pixels, settings_.elapsedSource, settings_.progressOutput);
    ResourceReclaimer reclaimer(sink, settings_.reclaimThreshold);
    RowProcessor processor(settings_.workerThreads, settings_.channelCapacity);

    const RowProcessingStats stats = processor.run(image, sink, progress, reclaimer);
    report.cellsWritten = stats.cellsWritten;
    report.failedWrites = stats.failedWrites;
    report.skippedPixels = stats.skippedPixels;
    report.reclamations = reclaimer.reclamations();

    sink.finalizeLayout();
    if (settings_.presentResult) {
        sink.present();
    }
    report.elapsed = progress.elapsed();

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(report.elapsed).count();
    printStatus("Converted " + std::to_string(report.cellsWritten) + " cells (" +
                std::to_string(report.targetSize.cols) + "x" + std::to_string(report.targetSize.rows) + ", A1:" +
                report.rightmostColumn + std::to_string(report.targetSize.rows) + ") in " +
                std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s, " +
                std::to_string(report.reclamations) + " reclamations");

    if (report.hasAnomalies()) {
        std::string summary = "Completed with anomalies:";
        if (report.pixelCountMismatch) {
            summary += " pixel count " + std::to_string(report.actualPixels) + " of " +
                    std::to_string(report.expectedPixels) + ";";
        }
        if (report.skippedPixels > 0) {
            summary += " " + std::to_string(report.skippedPixels) + " cells without source pixels;";
        }
        if (report.failedWrites > 0) {
            summary += " " + std::to_string(report.failedWrites) + " failed cell writes;";
        }
        summary.pop_back();
        printWarning(summary);
        LOG_WARN("GridPainter", summary);
    }

    ResourceManager::getInstance().printMemoryStatus();
    return report;
}
