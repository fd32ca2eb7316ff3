#ifndef COLUMN_ADDRESS_H
#define COLUMN_ADDRESS_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Spreadsheet column letters for a 1-based column number (bijective base-26).
 *
 * 1 -> "A", 26 -> "Z", 27 -> "AA", 702 -> "ZZ", 703 -> "AAA".
 * Pure, safe to call from any thread.
 *
 * @param column Column number, at least 1.
 * @return The letter address.
 * @throws std::invalid_argument if column is 0.
 */
std::string columnLetters(uint32_t column);

/**
 * @brief Inverse of columnLetters().
 * @throws std::invalid_argument on an empty string or a character outside A-Z.
 */
uint32_t columnNumber(const std::string &letters);

/**
 * @brief Letters for columns 1..count, computed once per conversion and shared by the row workers.
 */
std::vector<std::string> columnLetterTable(uint32_t count);

#endif // COLUMN_ADDRESS_H
