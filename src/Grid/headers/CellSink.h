#ifndef CELL_SINK_H
#define CELL_SINK_H

#include <cstdint>
#include "GridTypes.h"

/**
 * @brief Host-format interior color: r | g << 8 | b << 16.
 */
inline uint32_t toOleColor(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<uint32_t>(r) | (static_cast<uint32_t>(g) << 8) | (static_cast<uint32_t>(b) << 16);
}

inline Rgb fromOleColor(uint32_t ole) {
    return Rgb{static_cast<uint8_t>(ole & 0xFF), static_cast<uint8_t>((ole >> 8) & 0xFF),
               static_cast<uint8_t>((ole >> 16) & 0xFF)};
}

/**
 * @brief Document host that materializes colored cells.
 *
 * Error contract:
 *  - prepare() throws SinkUnavailableError when the host cannot be set up.
 *  - setCellColor() throws CellWriteError for a rejected single cell (non-fatal).
 *  - Any other exception from any call is fatal for the conversion.
 *
 * Unless isThreadSafe() returns true, every call must come from one thread.
 */
class CellSink {
public:
    virtual ~CellSink() = default;

    /**
     * @brief Obtain a blank sheet of at least size.rows x size.cols cells.
     */
    virtual void prepare(const TargetSize &size) = 0;

    virtual void setCellColor(const CellAddress &address, uint8_t r, uint8_t g, uint8_t b) = 0;

    /**
     * @brief Drop per-write formatting state held for rows firstRow..lastRow (inclusive).
     *
     * Cell colors stay; only the bookkeeping the host accumulated per write is released.
     */
    virtual void clearFormatting(uint32_t firstRow, uint32_t lastRow) = 0;

    /**
     * @brief Uniform row/column sizing and aspect-ratio lock of embedded shapes.
     */
    virtual void finalizeLayout() = 0;

    /**
     * @brief Show the finished grid (visible, maximized, zoomed out).
     */
    virtual void present() = 0;

    [[nodiscard]] virtual bool isThreadSafe() const = 0;
};

#endif // CELL_SINK_H
