#pragma once

#include <cstdint>

namespace memory {

/**
 * @brief Enum for categorizing memory blocks.
 */
enum class MemoryBlockCategory : uint8_t {
    GENERIC = 0,   /**< General-purpose allocation. */
    IMAGE   = 1,   /**< Decoded pixel storage. */
    GRID    = 2    /**< Sink-side cell and formatting storage. */
};

inline constexpr uint8_t MEMORY_CATEGORY_COUNT = 3;

/**
 * @brief Handle to a block owned by the ResourceManager pool.
 *
 * Encodes slot index (1-based, 0 is invalid), size bucket and category so a
 * block can be found again without a map lookup.
 */
struct MemoryBlockId {
    uint32_t pool_index{0};
    uint8_t  size_bucket{0};
    MemoryBlockCategory category{MemoryBlockCategory::GENERIC};

    MemoryBlockId() = default;

    MemoryBlockId(uint32_t idx, uint8_t bucket, MemoryBlockCategory cat)
        : pool_index(idx), size_bucket(bucket), category(cat) {}

    bool operator==(const MemoryBlockId &other) const {
        return pool_index == other.pool_index &&
               size_bucket == other.size_bucket &&
               category == other.category;
    }

    [[nodiscard]] bool isValid() const { return pool_index > 0; }
};

} // namespace memory
