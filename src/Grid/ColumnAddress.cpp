#include "headers/ColumnAddress.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

std::string columnLetters(uint32_t column) {
    if (column == 0) {
        throw std::invalid_argument("Column numbers start at 1");
    }

    std::string letters;
    uint32_t quotient = column;
    while (quotient > 0) {
        uint32_t remainder = quotient % 26;
        quotient /= 26;
        // No zero digit: a remainder of 0 is a 'Z' borrowed from the next place
        if (remainder == 0) {
            remainder = 26;
            --quotient;
        }
        letters.push_back(static_cast<char>('A' + remainder - 1));
    }
    std::reverse(letters.begin(), letters.end());
    return letters;
}

uint32_t columnNumber(const std::string &letters) {
    if (letters.empty()) {
        throw std::invalid_argument("Empty column address");
    }

    uint64_t value = 0;
    for (char c: letters) {
        if (c < 'A' || c > 'Z') {
            throw std::invalid_argument("Invalid column address: " + letters);
        }
        value = value * 26 + static_cast<uint64_t>(c - 'A' + 1);
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw std::invalid_argument("Column address out of range: " + letters);
        }
    }
    return static_cast<uint32_t>(value);
}

std::vector<std::string> columnLetterTable(uint32_t count) {
    std::vector<std::string> table;
    table.reserve(count);
    for (uint32_t column = 1; column <= count; ++column) {
        table.push_back(columnLetters(column));
    }
    return table;
}
