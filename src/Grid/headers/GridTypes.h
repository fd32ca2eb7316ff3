#ifndef GRID_TYPES_H
#define GRID_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Maximum rows and columns of the target grid.
 */
struct GridBounds {
    uint32_t maxRows{1048576};
    uint32_t maxCols{16384};
};

/**
 * @brief Grid size derived from the image by the size adjuster.
 */
struct TargetSize {
    uint32_t rows{0};
    uint32_t cols{0};

    bool operator==(const TargetSize &other) const = default;
};

struct Rgb {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};

    bool operator==(const Rgb &other) const = default;
};

/**
 * @brief Spreadsheet-style cell key: column letters plus 1-based row.
 */
struct CellAddress {
    std::string column;
    uint32_t row{0};

    [[nodiscard]] std::string toString() const { return column + std::to_string(row); }

    bool operator==(const CellAddress &other) const = default;
};

/**
 * @brief One pending write produced by a row worker.
 */
struct CellWrite {
    CellAddress address;
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
};

/**
 * @brief All writes of one image row, handed from a producer to the sink consumer.
 */
struct RowBatch {
    uint32_t row{0};
    std::vector<CellWrite> writes;

    [[nodiscard]] size_t getMemoryUsage() const {
        size_t bytes = sizeof(RowBatch) + writes.capacity() * sizeof(CellWrite);
        for (const auto &w: writes) {
            bytes += w.address.column.capacity();
        }
        return bytes;
    }
};

#endif // GRID_TYPES_H
