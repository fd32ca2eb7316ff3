#include "headers/GridSheet.h"
#include <algorithm>
#include <new>
#include <sstream>
#include "headers/ColumnAddress.h"
#include "headers/GridErrors.h"
#include "../Debug/headers/Debug.h"
#include "../Debug/headers/LogMacros.h"
#include "../Threading/headers/ResourceManager.h"

namespace {
    // Excel-style metrics: 7px maximum digit width, 5px cell padding, 96 dpi
    constexpr double MAX_DIGIT_WIDTH_PX = 7.0;
    constexpr double CELL_PADDING_PX = 5.0;
    constexpr double POINTS_PER_PIXEL = 72.0 / 96.0;

    constexpr double FINAL_COLUMN_WIDTH = 2.0;

    void appendTrueColor(std::ostringstream &out, const char *kind, uint32_t ole) {
        const Rgb c = fromOleColor(ole);
        out << "\033[" << kind << ";2;" << static_cast<int>(c.r) << ';' << static_cast<int>(c.g) << ';'
            << static_cast<int>(c.b) << 'm';
    }
}

GridSheet::GridSheet(std::ostream &view, size_t view_columns)
    : view_(view), view_columns_(std::max<size_t>(1, view_columns)) {
}

GridSheet::~GridSheet() {
    ResourceManager::getInstance().decreaseMemory(accounted_bytes_);
}

double GridSheet::columnWidthToPoints(double characters) {
    return (characters * MAX_DIGIT_WIDTH_PX + CELL_PADDING_PX) * POINTS_PER_PIXEL;
}

void GridSheet::checkOwner(const char *operation) const {
    if (!prepared_) {
        throw SinkFatalError(std::string("GridSheet::") + operation + " called before prepare()");
    }
    if (std::this_thread::get_id() != owner_) {
        throw SinkFatalError(std::string("GridSheet::") + operation +
                             " called from a thread that does not own the sheet");
    }
}

void GridSheet::account(size_t bytes_now) {
    auto &rm = ResourceManager::getInstance();
    if (bytes_now > accounted_bytes_) {
        rm.increaseMemory(bytes_now - accounted_bytes_);
    } else if (bytes_now < accounted_bytes_) {
        rm.decreaseMemory(accounted_bytes_ - bytes_now);
    }
    accounted_bytes_ = bytes_now;
}

void GridSheet::prepare(const TargetSize &size) {
    if (size.rows == 0 || size.cols == 0) {
        throw SinkUnavailableError("Worksheet could not be created: empty target size");
    }

    auto &rm = ResourceManager::getInstance();
    const uint64_t cell_bytes = static_cast<uint64_t>(size.rows) * size.cols * sizeof(uint32_t);
    if (cell_bytes > rm.getMaxMemory() ||
        rm.getCurrentMemoryUsage() - std::min(rm.getCurrentMemoryUsage(), accounted_bytes_) + cell_bytes >
        rm.getMaxMemory()) {
        throw SinkUnavailableError("Worksheet could not be created: " + std::to_string(size.cols) + "x" +
                                   std::to_string(size.rows) + " cells (" + formatDataSize(cell_bytes) +
                                   ") exceed the memory ceiling of " + formatDataSize(rm.getMaxMemory()));
    }

    try {
        std::vector<uint32_t>(static_cast<size_t>(cell_bytes / sizeof(uint32_t)), NO_FILL).swap(cells_);
    } catch (const std::bad_alloc &) {
        throw SinkUnavailableError("Worksheet could not be created: out of memory for " +
                                   formatDataSize(cell_bytes));
    }
    journal_.clear();
    journal_.shrink_to_fit();

    rows_ = size.rows;
    cols_ = size.cols;
    owner_ = std::this_thread::get_id();
    prepared_ = true;
    visible_ = false;
    writes_accepted_ = 0;
    records_cleared_ = 0;
    column_width_ = DEFAULT_COLUMN_WIDTH;
    row_height_ = DEFAULT_ROW_HEIGHT;
    zoom_ = 100;
    account(cells_.capacity() * sizeof(uint32_t));

    LOG_INF("GridSheet", "Prepared sheet of " + std::to_string(cols_) + "x" + std::to_string(rows_) + " cells");
}

void GridSheet::setCellColor(const CellAddress &address, uint8_t r, uint8_t g, uint8_t b) {
    checkOwner("setCellColor");

    uint32_t col = 0;
    try {
        col = columnNumber(address.column);
    } catch (const std::invalid_argument &e) {
        throw CellWriteError(std::string("Rejected cell ") + address.toString() + ": " + e.what());
    }
    if (address.row == 0 || address.row > rows_ || col == 0 || col > cols_) {
        throw CellWriteError("Rejected cell " + address.toString() + ": outside the " +
                             columnLetters(cols_) + std::to_string(rows_) + " sheet");
    }

    const uint32_t ole = toOleColor(r, g, b);
    cells_[indexOf(address.row, col)] = ole;

    const size_t capacity_before = journal_.capacity();
    journal_.push_back(StyleRecord{address.row, col, ole});
    if (journal_.capacity() != capacity_before) {
        account(cells_.capacity() * sizeof(uint32_t) + journal_.capacity() * sizeof(StyleRecord));
    }
    ++writes_accepted_;
}

void GridSheet::clearFormatting(uint32_t firstRow, uint32_t lastRow) {
    checkOwner("clearFormatting");
    if (firstRow > lastRow) {
        return;
    }

    const size_t before = journal_.size();
    std::erase_if(journal_, [firstRow, lastRow](const StyleRecord &rec) {
        return rec.row >= firstRow && rec.row <= lastRow;
    });
    const size_t released = before - journal_.size();
    records_cleared_ += released;
    journal_.shrink_to_fit();
    account(cells_.capacity() * sizeof(uint32_t) + journal_.capacity() * sizeof(StyleRecord));

    LOG_DBG("GridSheet", "Cleared " + std::to_string(released) + " style records for rows " +
            std::to_string(firstRow) + "-" + std::to_string(lastRow));
}

void GridSheet::finalizeLayout() {
    checkOwner("finalizeLayout");

    column_width_ = FINAL_COLUMN_WIDTH;
    row_height_ = columnWidthToPoints(column_width_);
    for (auto &shape: shapes_) {
        shape.lock_aspect_ratio = true;
    }
}

void GridSheet::addShape(const std::string &name) {
    shapes_.push_back(Shape{name, false});
}

std::optional<uint32_t> GridSheet::cellColor(const CellAddress &address) const {
    const uint32_t col = columnNumber(address.column);
    if (address.row == 0 || address.row > rows_ || col == 0 || col > cols_) {
        return std::nullopt;
    }
    const uint32_t value = cells_[indexOf(address.row, col)];
    if (value == NO_FILL) {
        return std::nullopt;
    }
    return value;
}

void GridSheet::present() {
    checkOwner("present");

    // One character per `step` cells horizontally; each text line holds two sampled rows
    const size_t step = (cols_ + view_columns_ - 1) / view_columns_;
    zoom_ = std::clamp(static_cast<int>(100 / step), MIN_ZOOM, MAX_ZOOM);
    visible_ = true;

    std::ostringstream out;
    for (size_t row = 0; row < rows_; row += 2 * step) {
        for (size_t col = 0; col < cols_; col += step) {
            const uint32_t top = cells_[row * cols_ + col];
            const size_t lower_row = row + step;
            const uint32_t bottom = lower_row < rows_ ? cells_[lower_row * cols_ + col] : NO_FILL;

            if (top == NO_FILL && bottom == NO_FILL) {
                out << ANSIColorConst::RESET << ' ';
                continue;
            }
            if (top == NO_FILL) {
                // Lower half only: paint it with the foreground over the default background
                appendTrueColor(out, "38", bottom);
                out << "\033[49m" << "▄";
            } else {
                appendTrueColor(out, "38", top);
                if (bottom != NO_FILL) appendTrueColor(out, "48", bottom);
                else out << "\033[49m";
                out << "▀";
            }
            out << ANSIColorConst::RESET;
        }
        out << ANSIColorConst::RESET << '\n';
    }

    {
        std::lock_guard<std::mutex> lock(gConsoleMutex);
        view_ << out.str() << std::flush;
    }
    LOG_INF("GridSheet", "Presented sheet at " + std::to_string(zoom_) + "% zoom");
}
