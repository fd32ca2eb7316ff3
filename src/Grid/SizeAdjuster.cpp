#include "headers/SizeAdjuster.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include "../Image/headers/BitmapImage.h"
#include "../Debug/headers/LogMacros.h"

TargetSize adjustSize(uint64_t width, uint64_t height, const GridBounds &bounds) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    if (bounds.maxRows == 0 || bounds.maxCols == 0) {
        throw std::invalid_argument("Grid bounds must be positive");
    }

    uint64_t newHeight = height;
    uint64_t newWidth = width;

    if (newHeight > bounds.maxRows) {
        newHeight = bounds.maxRows;
        newWidth = std::max<uint64_t>(1, newHeight * width / height);
    }

    if (newWidth > bounds.maxCols) {
        newHeight = std::max<uint64_t>(1, bounds.maxCols * newHeight / newWidth);
        newWidth = bounds.maxCols;
    }

    return TargetSize{static_cast<uint32_t>(newHeight), static_cast<uint32_t>(newWidth)};
}

bool needsResize(uint64_t width, uint64_t height, const GridBounds &bounds) {
    const TargetSize target = adjustSize(width, height, bounds);
    return target.rows != height || target.cols != width;
}

TargetSize adjustImageSize(BitmapImage &image, const GridBounds &bounds) {
    const auto width = static_cast<uint64_t>(image.getWidth());
    const auto height = static_cast<uint64_t>(image.getHeight());
    const TargetSize target = adjustSize(width, height, bounds);

    if (target.rows != height || target.cols != width) {
        LOG_INF("SizeAdjuster", "Resizing " + std::to_string(width) + "x" + std::to_string(height) +
                " to " + std::to_string(target.cols) + "x" + std::to_string(target.rows) + " to fit the grid");
        image.resize(static_cast<int>(target.rows), static_cast<int>(target.cols));
    }
    return target;
}
