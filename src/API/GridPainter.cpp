#define GRIDPAINTER_EXPORTS

#include "headers/GridPainter.h"
#include "../Grid/headers/GridErrors.h"
#include "../Grid/headers/GridSheet.h"
#include "../Image/headers/BitmapImage.h"
#include "../Threading/headers/ResourceManager.h"
#include "../Debug/headers/Debug.h"
#include "../Debug/headers/LogMacros.h"

#include <iostream>
#include <mutex>
#include <string>

namespace {
    // Internal logging callback function pointer
    void (*g_logCallback)(const char*) = nullptr;
    std::mutex g_callbackMutex;

    const char* VERSION = "1.0.0";

    void LogMessage(const std::string& message) {
        printMessage(message); // console echo in debug mode only
        LOG_INF("GridPainter", message);
    }

    ConverterSettings toSettings(const GridPainter::ConversionOptions& options) {
        ConverterSettings settings;
        settings.bounds = GridBounds{options.maxRows, options.maxColumns};
        settings.reclaimThreshold = options.reclaimThreshold;
        settings.workerThreads = options.workerThreads;
        settings.channelCapacity = options.channelCapacity;
        settings.presentResult = options.presentResult;
        return settings;
    }

    // Set in full on every call. The worker count travels in ConverterSettings,
    // so the process-wide thread ceiling is left alone.
    void applyResourceLimits(const GridPainter::ConversionOptions& options) {
        setDebugMode(options.debugMode);
        ResourceManager::getInstance().setMaxMemory(options.maxMemoryMB * 1024 * 1024);
    }
}

namespace GridPainter {

bool ImageToGrid(const std::string& imagePath, CellSink& sink, const ConversionOptions& options,
                 ConversionReport* report) {
    applyResourceLimits(options);

    try {
        LogMessage("Starting image-to-grid conversion");
        LogMessage("Input image: " + imagePath);
        LogMessage("Resources: " +
                   (options.workerThreads == 0 ? std::string("Auto") : std::to_string(options.workerThreads)) +
                   " threads, " + std::to_string(options.maxMemoryMB) + " MB memory, reclaim every " +
                   std::to_string(options.reclaimThreshold) + " writes");

        BitmapImage image = BitmapImage::load(imagePath);
        LogMessage("Decoded " + std::to_string(image.getWidth()) + "x" + std::to_string(image.getHeight()) +
                   " image");

        GridConverter converter(toSettings(options));
        ConversionReport result = converter.convert(image, sink);

        LogMessage("ImageToGrid operation completed" +
                   std::string(result.hasAnomalies() ? " with anomalies" : " successfully"));
        if (report) {
            *report = std::move(result);
        }
        return true;
    }
    catch (const SinkUnavailableError& e) {
        printError(std::string(e.what()) + ". Check that the sheet host can be created with the configured memory.");
        LOG_ERR("GridPainter", e.what());
    }
    catch (const GridError& e) {
        printError(e.what());
        LOG_ERR("GridPainter", e.what());
    }
    catch (const std::exception& e) {
        printError("Exception in ImageToGrid: " + std::string(e.what()));
        LOG_ERR("GridPainter", std::string("Exception in ImageToGrid: ") + e.what());
    }
    return false;
}

bool ImageToGrid(const std::string& imagePath, const ConversionOptions& options) {
    GridSheet sheet(std::cout);
    return ImageToGrid(imagePath, sheet, options, nullptr);
}

void SetLogCallback(void (*callback)(const char* message)) {
    {
        std::lock_guard<std::mutex> lock(g_callbackMutex);
        g_logCallback = callback;
    }

    if (!callback) {
        debug::LogBufferManager::getInstance().setListener(nullptr);
        return;
    }
    debug::LogBufferManager::getInstance().setListener(
        [](const std::string& buffer, const debug::LogEntry& entry) {
            if (buffer != "GridPainter") {
                return;
            }
            std::lock_guard<std::mutex> lock(g_callbackMutex);
            if (g_logCallback) {
                g_logCallback(entry.message.c_str());
            }
        });
}

const char* GetLibraryVersion() {
    return VERSION;
}

} // namespace GridPainter
