#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace Quadra {

/**
 * @brief Arena of fixed-size blocks handing out stable slots
 *
 * Blocks are never moved or freed while the pool lives, so a slot address
 * stays valid until the pool is destroyed. Released slots go to a free list
 * and are handed out again before a new block is allocated.
 *
 * Slots are default-constructed once with their block and never destroyed on
 * release; callers reinitialize an object after Allocate().
 *
 * @tparam T Pooled type (must be default constructible)
 * @tparam BlockSize Slots per block
 */
template<typename T, size_t BlockSize = 64>
class BlockPool {
    static_assert(BlockSize > 0, "BlockPool blocks must hold at least one slot");

public:
    BlockPool() = default;

    // Non-copyable (slots are referenced by address)
    BlockPool(const BlockPool&) = delete;
    BlockPool& operator=(const BlockPool&) = delete;

    [[nodiscard]] T* Allocate() {
        if (m_freeSlots.empty()) {
            Grow();
        }

        T* slot = m_freeSlots.back();
        m_freeSlots.pop_back();
        ++m_liveCount;
        return slot;
    }

    /**
     * @brief Hand a slot back for reuse; null is ignored
     */
    void Deallocate(T* slot) {
        if (slot == nullptr) {
            return;
        }
        m_freeSlots.push_back(slot);
        --m_liveCount;
    }

    /**
     * @brief Slots currently handed out
     */
    [[nodiscard]] size_t GetAllocatedCount() const noexcept { return m_liveCount; }

    /**
     * @brief Bytes held by blocks and bookkeeping
     */
    [[nodiscard]] size_t GetMemoryUsage() const noexcept {
        return m_blocks.size() * BlockSize * sizeof(T) +
               m_blocks.capacity() * sizeof(std::unique_ptr<T[]>) +
               m_freeSlots.capacity() * sizeof(T*);
    }

private:
    void Grow() {
        T* block = m_blocks.emplace_back(std::make_unique<T[]>(BlockSize)).get();

        // Back to front: a fresh block hands out its slots in address order
        m_freeSlots.reserve(m_freeSlots.size() + BlockSize);
        for (size_t i = BlockSize; i-- > 0;) {
            m_freeSlots.push_back(block + i);
        }
    }

    std::vector<std::unique_ptr<T[]>> m_blocks;
    std::vector<T*> m_freeSlots;
    size_t m_liveCount = 0;
};

} // namespace Quadra
