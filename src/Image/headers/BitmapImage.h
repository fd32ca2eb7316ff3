#ifndef BITMAP_IMAGE_H
#define BITMAP_IMAGE_H

#include <vector>
#include <cstring>
#include <cstdint>
#include <string>
#include <new>
#include <stdexcept>
#include "../../Threading/headers/ResourceManager.h"
#include "../../Debug/headers/MemoryTypes.h"  // for MemoryBlockId
#include "../../Grid/headers/GridTypes.h"

namespace detail {
    /**
     * @brief RAII wrapper over ResourceManager pooled memory for raw byte buffers.
     */
    class PixelBuffer {
    public:
        PixelBuffer() = default;

        PixelBuffer(PixelBuffer &&other) noexcept
            : block_(other.block_), rm_ptr_(other.rm_ptr_), bytes_(other.bytes_) {
            other.block_ = {};
            other.rm_ptr_ = nullptr;
            other.bytes_ = 0;
        }

        PixelBuffer &operator=(PixelBuffer &&other) noexcept {
            if (this != &other) {
                free();
                block_ = other.block_;
                rm_ptr_ = other.rm_ptr_;
                bytes_ = other.bytes_;
                other.block_ = {};
                other.rm_ptr_ = nullptr;
                other.bytes_ = 0;
            }
            return *this;
        }

        PixelBuffer(const PixelBuffer &) = delete;
        PixelBuffer &operator=(const PixelBuffer &) = delete;

        ~PixelBuffer() { free(); }

        /**
         * @brief Take a zero-filled block of at least bytes from the pool.
         * @throws std::bad_alloc when the pool cannot serve the request.
         */
        void allocate(size_t bytes, ResourceManager &rm) {
            free();
            if (bytes == 0) return;
            block_ = rm.getPooledMemory(bytes, memory::MemoryBlockCategory::IMAGE);
            if (!block_.isValid()) throw std::bad_alloc();
            rm_ptr_ = &rm;
            bytes_ = bytes;
            std::memset(rm.getMemoryPtr(block_), 0, bytes);
        }

        /**
         * @brief Hand the block back to the pool; it is freed at the next collection.
         */
        void free() {
            if (block_.isValid() && rm_ptr_) {
                rm_ptr_->releasePooledMemory(block_);
            }
            block_ = {};
            rm_ptr_ = nullptr;
            bytes_ = 0;
        }

        uint8_t *data() { return rm_ptr_ ? static_cast<uint8_t *>(rm_ptr_->getMemoryPtr(block_)) : nullptr; }
        const uint8_t *data() const { return rm_ptr_ ? static_cast<const uint8_t *>(rm_ptr_->getMemoryPtr(block_)) : nullptr; }

        // Requested size; the pooled block may be larger
        [[nodiscard]] size_t size() const { return bytes_; }

        [[nodiscard]] bool valid() const { return block_.isValid(); }
        [[nodiscard]] memory::MemoryBlockId id() const { return block_; }

    private:
        memory::MemoryBlockId block_{};
        ResourceManager *rm_ptr_{nullptr};
        size_t bytes_{0};
    };
}

/**
 * @brief BitmapImage is a 24-bit RGB raster (row-major, R,G,B byte order) with BMP/PPM I/O.
 */
class BitmapImage {
public:
    BitmapImage() : width(0), height(0), pixel_count(0) {
    }

    /**
     * @brief Construct a black image with the given dimensions.
     * @throws std::invalid_argument on non-positive dimensions.
     * @throws std::bad_alloc when the memory ceiling cannot hold the pixels.
     */
    BitmapImage(int width, int height);

    BitmapImage(const BitmapImage &other);

    BitmapImage &operator=(const BitmapImage &other);

    BitmapImage(BitmapImage &&other) noexcept
        : pixels(std::move(other.pixels)),
          width(other.width),
          height(other.height),
          pixel_count(other.pixel_count),
          row_extent(std::move(other.row_extent)) {
        other.width = 0;
        other.height = 0;
        other.pixel_count = 0;
    }

    BitmapImage &operator=(BitmapImage &&other) noexcept {
        if (this != &other) {
            pixels = std::move(other.pixels);
            width = other.width;
            height = other.height;
            pixel_count = other.pixel_count;
            row_extent = std::move(other.row_extent);

            other.width = 0;
            other.height = 0;
            other.pixel_count = 0;
        }
        return *this;
    }

    ~BitmapImage() = default;

    /**
     * @brief Decode an uncompressed 24/32-bit BMP or a binary PPM (P6).
     *
     * A file whose pixel data ends early still loads; the missing pixels stay
     * black, pixelCount() reports how many pixels the file really held and
     * decodedColumns() tells which of them they are.
     *
     * @param filename Path of the image file.
     * @return The decoded image.
     * @throws DecodeError if the file cannot be read or is not a supported image.
     */
    static BitmapImage load(const std::string &filename);

    /**
     * @brief Saves the image as a 24-bit bottom-up BMP file.
     * @param filename Path where the BMP file will be saved.
     * @return True if the image was saved successfully, false otherwise.
     */
    [[nodiscard]] bool save(const std::string &filename) const;

    /**
     * @brief Clears the image data and resets dimensions.
     */
    void clear();

    [[nodiscard]] int getWidth() const { return width; }

    [[nodiscard]] int getHeight() const { return height; }

    /**
     * @brief Number of pixels the decoder produced. Equals width*height unless the source was short.
     */
    [[nodiscard]] size_t pixelCount() const { return pixel_count; }

    /**
     * @brief Number of leading pixels of row y (0-based) that hold decoded data.
     *
     * Decoded pixels of a row always form a prefix, whatever the file's row order.
     * Equals getWidth() for every row of a complete image.
     */
    [[nodiscard]] int decodedColumns(int y) const;

    /**
     * @brief Pixel at a 0-based row-major index.
     * @throws std::out_of_range if index is outside the raster.
     */
    [[nodiscard]] Rgb getPixel(size_t index) const;

    /**
     * @brief Pixel at 0-based coordinates (x = column, y = row).
     */
    [[nodiscard]] Rgb getPixel(int x, int y) const;

    void setPixel(int x, int y, Rgb color);

    [[nodiscard]] static int bytes_per_pixel() { return 3; } // RGB format (3 bytes per pixel)

    [[nodiscard]] const unsigned char *get_pixel_data() const { return pixels.data(); }

    [[nodiscard]] size_t getMemoryUsage() const;

    /**
     * @brief Resamples the image in place with nearest-neighbour sampling.
     *
     * The previous pixel block goes back to the ResourceManager pool. A target
     * pixel sampled from an undecoded source pixel stays undecoded.
     *
     * @param new_height New height of the image in pixels.
     * @param new_width New width of the image in pixels.
     * @throws std::invalid_argument on non-positive dimensions.
     */
    void resize(int new_height, int new_width);

private:
    detail::PixelBuffer pixels;
    int width;
    int height;
    size_t pixel_count;
    std::vector<uint32_t> row_extent; // Decoded prefix per row; empty when complete

    // Static reference to ResourceManager to avoid repeated getInstance() calls
    static ResourceManager &rm_;

    /**
     * @brief Record a partial decode; pixel_count becomes the sum of the extents.
     */
    void setRowExtents(std::vector<uint32_t> extents);

    static BitmapImage decodeBmp(const std::vector<uint8_t> &file, const std::string &filename);

    static BitmapImage decodePpm(const std::vector<uint8_t> &file, const std::string &filename);

    [[nodiscard]] size_t offsetOf(int x, int y) const {
        return (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * bytes_per_pixel();
    }
};

#endif // BITMAP_IMAGE_H
