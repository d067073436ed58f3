#pragma once

#include "ICollisionActor.hpp"
#include "Shape.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace Quadra {

class QuadtreeNode;

/**
 * @brief Index record for one actor
 *
 * Holds a snapshot of the actor's bounds and category bits together with the
 * set of leaf nodes currently containing it. The node <-> entry link is kept
 * in both directions so that removal only touches the entry's own parents
 * instead of searching the tree.
 *
 * Entries are owned by the caller; nodes only reference them. An entry is
 * registered by address, so it can be neither copied nor moved, and it
 * detaches itself from every parent when destroyed.
 */
class QuadtreeEntry {
public:
    explicit QuadtreeEntry(ICollisionActor& actor);
    ~QuadtreeEntry();

    QuadtreeEntry(const QuadtreeEntry&) = delete;
    QuadtreeEntry& operator=(const QuadtreeEntry&) = delete;
    QuadtreeEntry(QuadtreeEntry&&) = delete;
    QuadtreeEntry& operator=(QuadtreeEntry&&) = delete;

    // =========================================================================
    // Snapshot
    // =========================================================================

    [[nodiscard]] ICollisionActor& GetActor() const noexcept { return *m_actor; }
    [[nodiscard]] const Shape& GetBounds() const noexcept { return m_bounds; }
    [[nodiscard]] Rect GetBoundingRect() const noexcept { return Quadra::GetBoundingRect(m_bounds); }
    [[nodiscard]] uint32_t GetLayer() const noexcept { return m_layer; }
    [[nodiscard]] uint32_t GetMask() const noexcept { return m_mask; }
    [[nodiscard]] glm::vec2 GetPreviousPosition() const noexcept { return m_previousPosition; }

    /**
     * @brief Check whether the actor moved since the last snapshot
     */
    [[nodiscard]] bool IsPositionDirty() const;

    /**
     * @brief Re-read bounds, layer, mask and position from the actor
     * @throws std::logic_error if the entry is still held by any node
     */
    void RefreshBounds();

    // =========================================================================
    // Parent bookkeeping
    // =========================================================================

    [[nodiscard]] const std::vector<QuadtreeNode*>& GetParents() const noexcept { return m_parents; }
    [[nodiscard]] bool IsAttached() const noexcept { return !m_parents.empty(); }

    void AddParent(QuadtreeNode* parent);
    void RemoveParent(QuadtreeNode* parent);

    /**
     * @brief Remove this entry from every node holding it
     *
     * Must be called before repositioning or deregistering the actor.
     */
    void RemoveFromAllParents();

    // =========================================================================
    // Traversal marker (see DedupScope)
    // =========================================================================

    [[nodiscard]] bool IsDirty() const noexcept { return m_dirty; }
    void MarkDirty() noexcept { m_dirty = true; }
    void MarkClean() noexcept { m_dirty = false; }

private:
    ICollisionActor* m_actor;
    Shape m_bounds;
    uint32_t m_layer;
    uint32_t m_mask;
    glm::vec2 m_previousPosition;
    std::vector<QuadtreeNode*> m_parents;
    bool m_dirty = false;
};

} // namespace Quadra
