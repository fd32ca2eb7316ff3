#ifndef GRID_ERRORS_H
#define GRID_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every failure raised by the conversion engine.
 */
class GridError : public std::runtime_error {
public:
    explicit GridError(const std::string &message) : std::runtime_error(message) {
    }
};

/**
 * @brief The image file could not be opened or decoded. Fatal.
 */
class DecodeError : public GridError {
public:
    explicit DecodeError(const std::string &message) : GridError(message) {
    }
};

/**
 * @brief The cell sink could not be initialized. Fatal, raised before any write.
 */
class SinkUnavailableError : public GridError {
public:
    explicit SinkUnavailableError(const std::string &message) : GridError(message) {
    }
};

/**
 * @brief A single cell write was rejected. Counted and skipped.
 */
class CellWriteError : public GridError {
public:
    explicit CellWriteError(const std::string &message) : GridError(message) {
    }
};

/**
 * @brief Any other sink failure. Aborts producers and consumer.
 */
class SinkFatalError : public GridError {
public:
    explicit SinkFatalError(const std::string &message) : GridError(message) {
    }
};

#endif // GRID_ERRORS_H
