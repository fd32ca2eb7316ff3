#ifndef GRID_CONVERTER_H
#define GRID_CONVERTER_H

#include <chrono>
#include <cstdint>
#include <string>
#include "GridTypes.h"
#include "CellSink.h"
#include "ProgressTracker.h"

class BitmapImage;

/**
 * @brief Outcome of one conversion run, including the non-fatal anomalies.
 */
struct ConversionReport {
    TargetSize targetSize;
    std::string rightmostColumn;
    uint64_t cellsWritten{0};
    uint64_t failedWrites{0};
    uint64_t skippedPixels{0};
    uint64_t reclamations{0};
    std::chrono::milliseconds elapsed{0};

    bool pixelCountMismatch{false};
    uint64_t expectedPixels{0};
    uint64_t actualPixels{0};

    [[nodiscard]] bool hasAnomalies() const { return pixelCountMismatch || failedWrites > 0 || skippedPixels > 0; }
};

struct ConverterSettings {
    GridBounds bounds;
    uint64_t reclaimThreshold{200000};
    size_t workerThreads{0}; // 0 = ResourceManager thread ceiling
    size_t channelCapacity{64};
    bool presentResult{true};

    // Optional overrides for the progress clock and output (tests)
    ProgressTracker::ElapsedSource elapsedSource;
    ProgressTracker::LineSink progressOutput;
};

/**
 * @brief Runs a whole image-to-grid conversion against a sink.
 *
 * Order: pixel count check, size adjustment (resampling the image), column
 * bound, sink prepare, row processing, final layout, present. Fatal errors
 * (SinkUnavailableError, SinkFatalError, anything unexpected) propagate
 * before the grid is presented.
 */
class GridConverter {
public:
    explicit GridConverter(ConverterSettings settings = {});

    /**
     * @brief Convert image into sink. The image is resized in place when it exceeds the bounds.
     *
     * Must be called from the thread that owns the sink.
     */
    ConversionReport convert(BitmapImage &image, CellSink &sink);

    [[nodiscard]] const ConverterSettings &settings() const { return settings_; }

    /**
     * @brief Warn when the decoder produced a pixel sequence of the wrong length.
     * @return True when the counts match.
     */
    static bool validatePixelCount(const BitmapImage &image, ConversionReport &report);

private:
    ConverterSettings settings_;
};

#endif // GRID_CONVERTER_H
