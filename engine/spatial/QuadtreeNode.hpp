#pragma once

#include "Rect.hpp"
#include "Shape.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace Quadra {

class Quadtree;
class QuadtreeEntry;
class DedupScope;

/**
 * @brief Node of a Quadtree
 *
 * A node is either a leaf holding entries or an internal node with exactly
 * four children; the two states are the alternatives of a variant, so an
 * internal node cannot hold entries.
 *
 * Leaf -> Internal happens only through Split() (a leaf at capacity receives
 * another entry below the depth cap). Internal -> Leaf happens only through
 * Shake() (fewer unique descendants than capacity).
 *
 * Nodes are allocated from the owning Quadtree's pool; all links between
 * nodes and entries are non-owning pointers.
 */
class QuadtreeNode {
public:
    struct Leaf {
        std::vector<QuadtreeEntry*> contents;
    };

    struct Internal {
        std::array<QuadtreeNode*, 4> children{};
    };

    using State = std::variant<Leaf, Internal>;

    QuadtreeNode() = default;
    ~QuadtreeNode() = default;

    // Non-copyable (entries and children point at this node)
    QuadtreeNode(const QuadtreeNode&) = delete;
    QuadtreeNode& operator=(const QuadtreeNode&) = delete;

    /**
     * @brief (Re)initialize a pooled node as an empty leaf
     */
    void Initialize(Quadtree* tree, const Rect& bounds, int depth,
                    int maxDepth, size_t maxObjectsPerNode);

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Insert an entry into every leaf of this subtree its bounds intersect
     *
     * Splits a full leaf first when the depth cap allows it. Does nothing if the
     * entry does not intersect this node.
     */
    void Insert(QuadtreeEntry& entry);

    /**
     * @brief Remove an entry from this leaf
     * @throws std::logic_error if this node is internal
     */
    void Remove(QuadtreeEntry& entry);

    /**
     * @brief Turn this leaf into an internal node with four children
     *
     * No-op on an internal node or when depth + 1 reaches the depth cap.
     */
    void Split();

    /**
     * @brief Collapse sparse subtrees back into leaves
     */
    void Shake();

    // =========================================================================
    // Traversal
    // =========================================================================

    /**
     * @brief Count unique entries in this subtree
     */
    [[nodiscard]] size_t NumTargets() const;

    /**
     * @brief Find every entry whose bounds intersect an area
     */
    [[nodiscard]] std::vector<QuadtreeEntry*> Query(const Shape& area) const;

    /**
     * @brief Find entries intersecting an area, leaving them marked in @p scope
     *
     * Entries already marked in the scope are skipped, so several queries
     * sharing a scope report each entry at most once.
     */
    void Query(const Shape& area, DedupScope& scope,
               std::vector<QuadtreeEntry*>& results) const;

    /**
     * @brief Find entries overlapping @p querier whose layer matches its mask
     */
    [[nodiscard]] std::vector<QuadtreeEntry*> Query(const QuadtreeEntry& querier) const;

    void Query(const QuadtreeEntry& querier, DedupScope& scope,
               std::vector<QuadtreeEntry*>& results) const;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] bool IsLeaf() const noexcept { return std::holds_alternative<Leaf>(m_state); }
    [[nodiscard]] const Rect& GetBounds() const noexcept { return m_bounds; }
    [[nodiscard]] int GetDepth() const noexcept { return m_depth; }
    [[nodiscard]] int GetMaxDepth() const noexcept { return m_maxDepth; }
    [[nodiscard]] size_t GetMaxObjectsPerNode() const noexcept { return m_maxObjectsPerNode; }

    /**
     * @brief Union of the layers of this leaf's contents (0 when internal)
     */
    [[nodiscard]] uint32_t GetLayerMask() const noexcept { return m_layerMask; }

    /**
     * @brief Entries held directly (empty on an internal node)
     */
    [[nodiscard]] std::span<QuadtreeEntry* const> GetContents() const noexcept;

    /**
     * @brief Child nodes (empty on a leaf)
     */
    [[nodiscard]] std::span<QuadtreeNode* const> GetChildren() const noexcept;

    [[nodiscard]] QuadtreeNode* GetChild(size_t index) const noexcept;

private:
    friend class Quadtree;

    void AddToLeaf(QuadtreeEntry& entry);
    void UpdateLayerMask();

    /**
     * @brief Unique entries of this subtree in breadth-first order, ignoring dirty flags
     */
    [[nodiscard]] std::vector<QuadtreeEntry*> CollectUniqueEntries() const;

    /**
     * @brief Return every descendant to the pool, detaching their entries
     */
    void ReleaseChildren();

    template<typename Node, typename Func>
    static void VisitLeavesBreadthFirst(Node* root, Func&& func);

    Quadtree* m_tree = nullptr;
    Rect m_bounds;
    int m_depth = 0;
    int m_maxDepth = 0;
    size_t m_maxObjectsPerNode = 0;
    State m_state;
    uint32_t m_layerMask = 0;
};

} // namespace Quadra
