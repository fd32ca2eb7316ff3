/**
 * @file GridPainter.h
 * @brief Public API for the GridPainter library
 *
 * Renders an image as a grid of colored cells, one cell per pixel, in a
 * spreadsheet-like sheet. Applications include this header and link against
 * gridpainter_core.
 */

#ifndef GRIDPAINTER_H
#define GRIDPAINTER_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "../../Grid/headers/CellSink.h"
#include "../../Grid/headers/GridConverter.h"

#ifdef _WIN32
    #ifdef GRIDPAINTER_EXPORTS
        #define GRIDPAINTER_API __declspec(dllexport)
    #else
        #define GRIDPAINTER_API __declspec(dllimport)
    #endif
#else
    #define GRIDPAINTER_API
#endif

namespace GridPainter {

/**
 * @brief Run-wide settings. Defaults match the reference spreadsheet format.
 */
struct ConversionOptions {
    uint32_t maxRows = 1048576;
    uint32_t maxColumns = 16384;
    uint64_t reclaimThreshold = 200000; // Writes between reclamation passes
    size_t workerThreads = 0; // 0 = auto
    size_t channelCapacity = 64; // Row batches in flight to the sink
    size_t maxMemoryMB = 1024;
    bool debugMode = false;
    bool presentResult = true;
};

/**
 * @brief Convert an image file into a terminal-rendered grid sheet
 *
 * @param imagePath Path to a BMP or binary PPM image
 * @param options Conversion settings
 * @return bool True if the conversion completed (possibly with non-fatal anomalies)
 */
GRIDPAINTER_API bool ImageToGrid(
    const std::string& imagePath,
    const ConversionOptions& options = ConversionOptions()
);

/**
 * @brief Convert an image file into a caller-supplied sink
 *
 * Must be called on the thread that owns the sink.
 *
 * @param imagePath Path to a BMP or binary PPM image
 * @param sink Target grid host
 * @param options Conversion settings
 * @param report Receives the run summary when not null
 * @return bool True if the conversion completed, false on a fatal error
 */
GRIDPAINTER_API bool ImageToGrid(
    const std::string& imagePath,
    CellSink& sink,
    const ConversionOptions& options,
    ConversionReport* report = nullptr
);

/**
 * @brief Set the logging callback function for the library
 *
 * Receives every message logged to the "GridPainter" buffer. Pass nullptr to remove it.
 *
 * @param callback Function pointer to a logging callback function
 */
GRIDPAINTER_API void SetLogCallback(void (*callback)(const char* message));

/**
 * @brief Get the version string of the GridPainter library
 *
 * @return const char* Version string in the format "Major.Minor.Patch"
 */
GRIDPAINTER_API const char* GetLibraryVersion();

} // namespace GridPainter

#endif // GRIDPAINTER_H
