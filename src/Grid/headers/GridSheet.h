#ifndef GRID_SHEET_H
#define GRID_SHEET_H

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "CellSink.h"

/**
 * @brief In-process spreadsheet host rendering to a text terminal.
 *
 * Not thread-safe: after prepare() every call must come from the same
 * thread, calls from any other thread are rejected with SinkFatalError.
 * Each setCellColor() also appends a style record that stays alive until
 * clearFormatting() covers its row.
 */
class GridSheet : public CellSink {
public:
    // Interior color value of a cell that was never written
    static constexpr uint32_t NO_FILL = 0xFFFFFFFFu;
    static constexpr double DEFAULT_COLUMN_WIDTH = 8.43;
    static constexpr double DEFAULT_ROW_HEIGHT = 15.0;
    static constexpr int MIN_ZOOM = 10;
    static constexpr int MAX_ZOOM = 400;

    struct Shape {
        std::string name;
        bool lock_aspect_ratio{false};
    };

    /**
     * @param view Stream present() draws to.
     * @param view_columns Character columns available to present().
     */
    explicit GridSheet(std::ostream &view = std::cout, size_t view_columns = 160);

    ~GridSheet() override;

    GridSheet(const GridSheet &) = delete;
    GridSheet &operator=(const GridSheet &) = delete;

    void prepare(const TargetSize &size) override;

    void setCellColor(const CellAddress &address, uint8_t r, uint8_t g, uint8_t b) override;

    void clearFormatting(uint32_t firstRow, uint32_t lastRow) override;

    void finalizeLayout() override;

    void present() override;

    [[nodiscard]] bool isThreadSafe() const override { return false; }

    /**
     * @brief Embed a named shape (picture, comment box) on the sheet.
     */
    void addShape(const std::string &name);

    [[nodiscard]] uint32_t rows() const { return rows_; }
    [[nodiscard]] uint32_t cols() const { return cols_; }

    /**
     * @brief OLE color of a cell, empty if it was never filled.
     */
    [[nodiscard]] std::optional<uint32_t> cellColor(const CellAddress &address) const;

    [[nodiscard]] size_t journalSize() const { return journal_.size(); }
    [[nodiscard]] uint64_t writesAccepted() const { return writes_accepted_; }
    [[nodiscard]] uint64_t journalRecordsCleared() const { return records_cleared_; }
    [[nodiscard]] double columnWidth() const { return column_width_; }
    [[nodiscard]] double rowHeight() const { return row_height_; }
    [[nodiscard]] int zoom() const { return zoom_; }
    [[nodiscard]] bool isVisible() const { return visible_; }
    [[nodiscard]] const std::vector<Shape> &shapes() const { return shapes_; }

    /**
     * @brief Width of one cell in points for a column width given in characters.
     */
    static double columnWidthToPoints(double characters);

private:
    struct StyleRecord {
        uint32_t row;
        uint32_t col;
        uint32_t interior_color;
    };

    std::ostream &view_;
    size_t view_columns_;

    uint32_t rows_{0};
    uint32_t cols_{0};
    std::vector<uint32_t> cells_;
    std::vector<StyleRecord> journal_;
    std::vector<Shape> shapes_;

    std::thread::id owner_;
    bool prepared_{false};
    uint64_t writes_accepted_{0};
    uint64_t records_cleared_{0};
    size_t accounted_bytes_{0};

    double column_width_{DEFAULT_COLUMN_WIDTH};
    double row_height_{DEFAULT_ROW_HEIGHT};
    int zoom_{100};
    bool visible_{false};

    void checkOwner(const char *operation) const;

    void account(size_t bytes_now);

    [[nodiscard]] size_t indexOf(uint32_t row, uint32_t col) const {
        return static_cast<size_t>(row - 1) * cols_ + (col - 1);
    }
};

#endif // GRID_SHEET_H
