#ifndef SIZE_ADJUSTER_H
#define SIZE_ADJUSTER_H

#include <cstdint>
#include "GridTypes.h"

class BitmapImage;

/**
 * @brief Clamp image dimensions to the grid bounds, keeping the aspect ratio.
 *
 * Rows are clamped first; the column clamp then works from the already
 * reduced height and width, so the two steps are not independent. Integer
 * division truncates. Neither dimension drops below 1.
 *
 * @param width Image width in pixels (> 0).
 * @param height Image height in pixels (> 0).
 * @param bounds Grid limits.
 * @return The target grid size; equal to the input when it already fits.
 * @throws std::invalid_argument on zero dimensions or zero bounds.
 */
TargetSize adjustSize(uint64_t width, uint64_t height, const GridBounds &bounds);

/**
 * @brief True when adjustSize() would change the dimensions.
 */
bool needsResize(uint64_t width, uint64_t height, const GridBounds &bounds);

/**
 * @brief Compute the target size for image and resample it in place when it does not fit.
 *
 * @return The size the image has afterwards.
 */
TargetSize adjustImageSize(BitmapImage &image, const GridBounds &bounds);

#endif // SIZE_ADJUSTER_H
