#include "headers/BitmapImage.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include "../Debug/headers/LogMacros.h"
#include "../Grid/headers/GridErrors.h"

ResourceManager &BitmapImage::rm_ = ResourceManager::getInstance();

namespace {
    // Largest dimension accepted from a file header
    constexpr int64_t MAX_DIMENSION = std::numeric_limits<int32_t>::max();

    uint16_t readLe16(const std::vector<uint8_t> &buf, size_t pos) {
        return static_cast<uint16_t>(buf[pos] | (buf[pos + 1] << 8));
    }

    uint32_t readLe32(const std::vector<uint8_t> &buf, size_t pos) {
        return static_cast<uint32_t>(buf[pos]) |
               (static_cast<uint32_t>(buf[pos + 1]) << 8) |
               (static_cast<uint32_t>(buf[pos + 2]) << 16) |
               (static_cast<uint32_t>(buf[pos + 3]) << 24);
    }

    void writeLe16(std::ostream &os, uint16_t value) {
        const char bytes[2] = {static_cast<char>(value & 0xFF), static_cast<char>((value >> 8) & 0xFF)};
        os.write(bytes, 2);
    }

    void writeLe32(std::ostream &os, uint32_t value) {
        const char bytes[4] = {
            static_cast<char>(value & 0xFF), static_cast<char>((value >> 8) & 0xFF),
            static_cast<char>((value >> 16) & 0xFF), static_cast<char>((value >> 24) & 0xFF)
        };
        os.write(bytes, 4);
    }

    /**
     * @brief Next whitespace-separated header token of a PPM file, skipping '#' comments.
     */
    std::string nextPpmToken(const std::vector<uint8_t> &buf, size_t &pos) {
        while (pos < buf.size()) {
            if (buf[pos] == '#') {
                while (pos < buf.size() && buf[pos] != '\n') ++pos;
            } else if (std::isspace(buf[pos])) {
                ++pos;
            } else {
                break;
            }
        }
        std::string token;
        while (pos < buf.size() && !std::isspace(buf[pos]) && buf[pos] != '#') {
            token.push_back(static_cast<char>(buf[pos++]));
        }
        return token;
    }

    int parsePpmNumber(const std::string &token, const std::string &filename, const char *what) {
        if (token.empty() || !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw DecodeError("Malformed PPM " + std::string(what) + " in " + filename);
        }
        if (token.size() > 10) {
            throw DecodeError("PPM " + std::string(what) + " out of range in " + filename);
        }
        const long long value = std::stoll(token);
        if (value <= 0 || value > MAX_DIMENSION) {
            throw DecodeError("Invalid PPM " + std::string(what) + " (" + token + ") in " + filename);
        }
        return static_cast<int>(value);
    }

    BitmapImage allocateImage(int width, int height, const std::string &filename) {
        try {
            return BitmapImage(width, height);
        } catch (const std::bad_alloc &) {
            throw DecodeError("Not enough memory to decode " + std::to_string(width) + "x" +
                              std::to_string(height) + " image " + filename);
        }
    }
}

BitmapImage::BitmapImage(int width, int height) : width(0), height(0), pixel_count(0) {
    if (width <= 0 || height <= 0) {
        LOG_ERR("BitmapImage", "BitmapImage: invalid dimensions " + std::to_string(width) + "x" +
                std::to_string(height));
        throw std::invalid_argument("BitmapImage dimensions must be positive");
    }

    const size_t total_bytes = static_cast<size_t>(width) * static_cast<size_t>(height) * bytes_per_pixel();
    pixels.allocate(total_bytes, rm_);

    this->width = width;
    this->height = height;
    this->pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);
}

BitmapImage::BitmapImage(const BitmapImage &other) : width(0), height(0), pixel_count(0) {
    *this = other;
}

BitmapImage &BitmapImage::operator=(const BitmapImage &other) {
    if (this == &other) return *this;

    detail::PixelBuffer copy;
    if (other.pixels.valid()) {
        copy.allocate(other.pixels.size(), rm_);
        std::memcpy(copy.data(), other.pixels.data(), other.pixels.size());
    }
    pixels = std::move(copy);
    width = other.width;
    height = other.height;
    pixel_count = other.pixel_count;
    row_extent = other.row_extent;
    return *this;
}

void BitmapImage::clear() {
    pixels.free();
    width = 0;
    height = 0;
    pixel_count = 0;
    row_extent.clear();
}

int BitmapImage::decodedColumns(int y) const {
    if (y < 0 || y >= height) {
        throw std::out_of_range("Row " + std::to_string(y) + " outside image");
    }
    return row_extent.empty() ? width : static_cast<int>(row_extent[static_cast<size_t>(y)]);
}

void BitmapImage::setRowExtents(std::vector<uint32_t> extents) {
    size_t total = 0;
    bool complete = true;
    for (uint32_t e: extents) {
        total += e;
        complete = complete && e == static_cast<uint32_t>(width);
    }
    pixel_count = total;
    if (complete) {
        row_extent.clear();
    } else {
        row_extent = std::move(extents);
    }
}

Rgb BitmapImage::getPixel(size_t index) const {
    if (index >= static_cast<size_t>(width) * static_cast<size_t>(height)) {
        throw std::out_of_range("Pixel index " + std::to_string(index) + " outside " +
                                std::to_string(width) + "x" + std::to_string(height) + " image");
    }
    const uint8_t *p = pixels.data() + index * bytes_per_pixel();
    return Rgb{p[0], p[1], p[2]};
}

Rgb BitmapImage::getPixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width || y >= height) {
        throw std::out_of_range("Pixel (" + std::to_string(x) + "," + std::to_string(y) + ") outside image");
    }
    const uint8_t *p = pixels.data() + offsetOf(x, y);
    return Rgb{p[0], p[1], p[2]};
}

void BitmapImage::setPixel(int x, int y, Rgb color) {
    if (x < 0 || y < 0 || x >= width || y >= height) {
        throw std::out_of_range("Pixel (" + std::to_string(x) + "," + std::to_string(y) + ") outside image");
    }
    uint8_t *p = pixels.data() + offsetOf(x, y);
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
}

size_t BitmapImage::getMemoryUsage() const {
    return sizeof(BitmapImage) + pixels.size();
}

void BitmapImage::resize(int new_height, int new_width) {
    if (new_width <= 0 || new_height <= 0) {
        LOG_ERR("BitmapImage", "BitmapImage::resize: invalid dimensions " + std::to_string(new_width) + "x" +
                std::to_string(new_height));
        throw std::invalid_argument("BitmapImage::resize dimensions must be positive");
    }
    if (new_width == width && new_height == height) {
        return;
    }

    detail::PixelBuffer resampled;
    resampled.allocate(static_cast<size_t>(new_width) * static_cast<size_t>(new_height) * bytes_per_pixel(), rm_);

    const uint8_t *src = pixels.data();
    uint8_t *dst = resampled.data();
    for (int y = 0; y < new_height; ++y) {
        const auto src_y = static_cast<size_t>(static_cast<uint64_t>(y) * height / new_height);
        for (int x = 0; x < new_width; ++x) {
            const auto src_x = static_cast<size_t>(static_cast<uint64_t>(x) * width / new_width);
            const uint8_t *from = src + (src_y * width + src_x) * bytes_per_pixel();
            uint8_t *to = dst + (static_cast<size_t>(y) * new_width + x) * bytes_per_pixel();
            to[0] = from[0];
            to[1] = from[1];
            to[2] = from[2];
        }
    }

    // src_x(x) < e  <=>  x < ceil(e * new_width / width), so prefixes map to prefixes
    std::vector<uint32_t> resampled_extent;
    if (!row_extent.empty()) {
        resampled_extent.resize(static_cast<size_t>(new_height));
        for (int y = 0; y < new_height; ++y) {
            const auto src_y = static_cast<size_t>(static_cast<uint64_t>(y) * height / new_height);
            const uint64_t e = row_extent[src_y];
            resampled_extent[static_cast<size_t>(y)] = static_cast<uint32_t>(std::min<uint64_t>(
                new_width, (e * static_cast<uint64_t>(new_width) + width - 1) / width));
        }
    }

    LOG_DBG("BitmapImage", "Resampled " + std::to_string(width) + "x" + std::to_string(height) + " to " +
            std::to_string(new_width) + "x" + std::to_string(new_height));

    pixels = std::move(resampled);
    width = new_width;
    height = new_height;
    if (resampled_extent.empty()) {
        pixel_count = static_cast<size_t>(new_width) * static_cast<size_t>(new_height);
    } else {
        setRowExtents(std::move(resampled_extent));
    }
}

BitmapImage BitmapImage::load(const std::string &filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw DecodeError("Cannot open image file: " + filename);
    }
    std::vector<uint8_t> file((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw DecodeError("Failed reading image file: " + filename);
    }

    if (file.size() >= 2 && file[0] == 'B' && file[1] == 'M') {
        return decodeBmp(file, filename);
    }
    if (file.size() >= 2 && file[0] == 'P' && file[1] == '6') {
        return decodePpm(file, filename);
    }
    throw DecodeError("Unsupported image format (expected BMP or binary PPM): " + filename);
}

BitmapImage BitmapImage::decodeBmp(const std::vector<uint8_t> &file, const std::string &filename) {
    constexpr size_t FILE_HEADER_SIZE = 14;
    constexpr size_t MIN_INFO_HEADER_SIZE = 40;
    if (file.size() < FILE_HEADER_SIZE + MIN_INFO_HEADER_SIZE) {
        throw DecodeError("Truncated BMP header in " + filename);
    }

    const uint32_t data_offset = readLe32(file, 10);
    const uint32_t info_size = readLe32(file, 14);
    const auto raw_width = static_cast<int32_t>(readLe32(file, 18));
    const auto raw_height = static_cast<int32_t>(readLe32(file, 22));
    const uint16_t bit_count = readLe16(file, 28);
    const uint32_t compression = readLe32(file, 30);

    if (info_size < MIN_INFO_HEADER_SIZE) {
        throw DecodeError("Unsupported BMP header (OS/2 core headers are not supported) in " + filename);
    }
    if (bit_count != 24 && bit_count != 32) {
        throw DecodeError("Unsupported BMP bit depth " + std::to_string(bit_count) + " in " + filename);
    }
    // BI_RGB, or BI_BITFIELDS with the default 32-bit layout
    if (compression != 0 && !(compression == 3 && bit_count == 32)) {
        throw DecodeError("Compressed BMP files are not supported: " + filename);
    }
    if (raw_width <= 0 || raw_height == 0 || raw_height == std::numeric_limits<int32_t>::min()) {
        throw DecodeError("Invalid BMP dimensions in " + filename);
    }
    if (data_offset > file.size()) {
        throw DecodeError("BMP pixel data offset past end of file in " + filename);
    }

    const bool top_down = raw_height < 0;
    const int width = raw_width;
    const int height = top_down ? -raw_height : raw_height;
    const size_t src_bpp = bit_count / 8;
    const size_t row_stride = ((static_cast<size_t>(bit_count) * width + 31) / 32) * 4;

    BitmapImage image = allocateImage(width, height, filename);

    size_t decoded = 0;
    std::vector<uint32_t> extents(static_cast<size_t>(height), 0);
    for (int file_row = 0; file_row < height; ++file_row) {
        const size_t row_start = data_offset + static_cast<size_t>(file_row) * row_stride;
        const int y = top_down ? file_row : height - 1 - file_row;
        for (int x = 0; x < width; ++x) {
            const size_t pos = row_start + static_cast<size_t>(x) * src_bpp;
            if (pos + 3 > file.size()) {
                break;
            }
            // Stored as B,G,R(,A)
            image.setPixel(x, y, Rgb{file[pos + 2], file[pos + 1], file[pos]});
            ++extents[static_cast<size_t>(y)];
            ++decoded;
        }
    }

    // Bottom-up files lose their top rows first
    image.setRowExtents(std::move(extents));
    if (decoded < static_cast<size_t>(width) * static_cast<size_t>(height)) {
        LOG_WARN("BitmapImage", "BMP pixel data ends early in " + filename + ": " + std::to_string(decoded) +
                 " of " + std::to_string(static_cast<size_t>(width) * height) + " pixels");
    }
    LOG_DBG("BitmapImage", "Decoded BMP " + filename + " (" + std::to_string(width) + "x" +
            std::to_string(height) + ", " + std::to_string(bit_count) + " bpp)");
    return image;
}

BitmapImage BitmapImage::decodePpm(const std::vector<uint8_t> &file, const std::string &filename) {
    size_t pos = 2;
    const int width = parsePpmNumber(nextPpmToken(file, pos), filename, "width");
    const int height = parsePpmNumber(nextPpmToken(file, pos), filename, "height");
    const int maxval = parsePpmNumber(nextPpmToken(file, pos), filename, "maxval");
    if (maxval > 255) {
        throw DecodeError("16-bit PPM files are not supported: " + filename);
    }
    if (pos >= file.size() || !std::isspace(file[pos])) {
        throw DecodeError("Malformed PPM header in " + filename);
    }
    ++pos; // single whitespace before the raster

    BitmapImage image = allocateImage(width, height, filename);

    const auto scale = [maxval](uint8_t v) {
        return static_cast<uint8_t>(std::min(255, v * 255 / maxval));
    };

    const size_t available = (file.size() - pos) / 3;
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height);
    const size_t decoded = std::min(available, expected);
    uint8_t *dst = image.pixels.data();
    for (size_t i = 0; i < decoded; ++i) {
        const uint8_t *src = file.data() + pos + i * 3;
        dst[i * 3] = scale(src[0]);
        dst[i * 3 + 1] = scale(src[1]);
        dst[i * 3 + 2] = scale(src[2]);
    }

    std::vector<uint32_t> extents(static_cast<size_t>(height), 0);
    for (size_t y = 0; y < extents.size(); ++y) {
        const size_t row_start = y * static_cast<size_t>(width);
        extents[y] = static_cast<uint32_t>(std::min<size_t>(width, decoded - std::min(decoded, row_start)));
    }
    image.setRowExtents(std::move(extents));
    if (decoded < expected) {
        LOG_WARN("BitmapImage", "PPM pixel data ends early in " + filename + ": " + std::to_string(decoded) +
                 " of " + std::to_string(expected) + " pixels");
    }
    return image;
}

bool BitmapImage::save(const std::string &filename) const {
    if (!pixels.valid()) {
        LOG_ERR("BitmapImage", "BitmapImage::save: image is empty");
        return false;
    }

    const std::string temp_filename = filename + ".tmp";
    {
        std::ofstream out(temp_filename, std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_ERR("BitmapImage", "Failed to open temporary file for writing: " + temp_filename);
            return false;
        }

        const size_t data_row_size = static_cast<size_t>(width) * bytes_per_pixel();
        const size_t padding = (4 - (data_row_size % 4)) % 4;
        const size_t image_size = (data_row_size + padding) * static_cast<size_t>(height);
        constexpr uint32_t headers_size = 14 + 40;

        // BITMAPFILEHEADER
        out.write("BM", 2);
        writeLe32(out, static_cast<uint32_t>(headers_size + image_size));
        writeLe16(out, 0);
        writeLe16(out, 0);
        writeLe32(out, headers_size);

        // BITMAPINFOHEADER
        writeLe32(out, 40);
        writeLe32(out, static_cast<uint32_t>(width));
        writeLe32(out, static_cast<uint32_t>(height)); // positive: bottom-up
        writeLe16(out, 1);
        writeLe16(out, 24);
        writeLe32(out, 0);
        writeLe32(out, static_cast<uint32_t>(image_size));
        writeLe32(out, 2835);
        writeLe32(out, 2835);
        writeLe32(out, 0);
        writeLe32(out, 0);

        std::vector<char> row(data_row_size + padding, 0);
        const uint8_t *base = pixels.data();
        for (int y = height - 1; y >= 0; --y) {
            const uint8_t *src = base + static_cast<size_t>(y) * data_row_size;
            for (int x = 0; x < width; ++x) {
                row[x * 3] = static_cast<char>(src[x * 3 + 2]);
                row[x * 3 + 1] = static_cast<char>(src[x * 3 + 1]);
                row[x * 3 + 2] = static_cast<char>(src[x * 3]);
            }
            out.write(row.data(), static_cast<std::streamsize>(row.size()));
        }

        if (!out) {
            LOG_ERR("BitmapImage", "Failed writing " + temp_filename);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_filename, filename, ec);
    if (ec) {
        LOG_ERR("BitmapImage", "Failed to rename temporary file " + temp_filename + " to " + filename +
                ". Error: " + ec.message());
        std::error_code remove_ec;
        std::filesystem::remove(temp_filename, remove_ec);
        return false;
    }
    return true;
}
