/**
 * @file Quadtree.hpp
 * @brief 2D broad-phase quadtree over movable actors
 *
 * The Quadtree answers "which actors overlap this area / this actor?" once
 * per simulation tick without testing every pair. Actors are wrapped in
 * caller-owned QuadtreeEntry records; nodes are pooled inside the tree.
 *
 * @section quadtree_protocol Per-tick protocol
 *
 * Entries snapshot their actor's bounds, so a moved actor must be taken out
 * of the tree and put back:
 *
 * @code{.cpp}
 * Quadra::Quadtree tree(Quadra::Rect::FromPositionSize(0, 0, 1024, 768));
 * Quadra::QuadtreeEntry entry(actor);
 * tree.Insert(entry);
 *
 * // every tick
 * if (entry.IsPositionDirty()) {
 *     tree.Reinsert(entry);   // RemoveFromAllParents + RefreshBounds + Insert
 * }
 * for (Quadra::QuadtreeEntry* other : tree.Query(entry)) {
 *     // narrow phase...
 * }
 * tree.Shake();               // collapse subtrees that emptied out
 * @endcode
 *
 * @section quadtree_dedup Deduplication
 *
 * An entry straddling quadrant boundaries sits in several leaves. Traversals
 * report it once by marking it dirty through a DedupScope. The plain Query()
 * overloads clean up before returning; the overloads taking a DedupScope leave
 * the marks in place so several queries can share one result set.
 */

#pragma once

#include "QuadtreeNode.hpp"
#include "QuadtreeEntry.hpp"
#include "QuadtreeConfig.hpp"
#include "DedupScope.hpp"
#include "Rect.hpp"
#include "Shape.hpp"
#include "core/Pool.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace Quadra {

/**
 * @brief Per-node data handed to debug overlays
 */
struct QuadtreeNodeInfo {
    Rect bounds;
    int depth = 0;
    bool isLeaf = true;
    size_t occupantCount = 0;   // Unique entries in the node's subtree
};

/**
 * @brief Structure statistics
 */
struct QuadtreeStats {
    size_t nodeCount = 0;
    size_t leafCount = 0;
    size_t entryCount = 0;      // Unique entries in the whole tree
    int maxDepth = 0;           // Deepest leaf
};

/**
 * @brief Owner of the node pool and the root of a quadtree
 */
class Quadtree {
public:
    using NodeVisitor = std::function<void(const QuadtreeNodeInfo& info)>;

    /**
     * @throws std::invalid_argument if the configuration is not valid
     */
    explicit Quadtree(const QuadtreeConfig& config);

    explicit Quadtree(const Rect& worldBounds,
                      int maxDepth = QuadtreeConfig::DefaultMaxDepth,
                      size_t maxObjectsPerNode = QuadtreeConfig::DefaultMaxObjectsPerNode);

    ~Quadtree();

    // Non-copyable, non-movable (nodes point back at the tree)
    Quadtree(const Quadtree&) = delete;
    Quadtree& operator=(const Quadtree&) = delete;
    Quadtree(Quadtree&&) = delete;
    Quadtree& operator=(Quadtree&&) = delete;

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Insert from the root; entries outside the world are dropped
     */
    void Insert(QuadtreeEntry& entry);

    /**
     * @brief Move an entry to its actor's current bounds
     */
    void Reinsert(QuadtreeEntry& entry);

    /**
     * @brief Collapse sparse subtrees starting at the root
     */
    void Shake();

    /**
     * @brief Detach every entry and collapse the root into an empty leaf
     */
    void Clear();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::vector<QuadtreeEntry*> Query(const Shape& area) const;
    void Query(const Shape& area, DedupScope& scope, std::vector<QuadtreeEntry*>& results) const;

    [[nodiscard]] std::vector<QuadtreeEntry*> Query(const QuadtreeEntry& querier) const;
    void Query(const QuadtreeEntry& querier, DedupScope& scope,
               std::vector<QuadtreeEntry*>& results) const;

    /**
     * @brief Number of unique entries in the tree
     */
    [[nodiscard]] size_t NumTargets() const;

    // =========================================================================
    // Inspection
    // =========================================================================

    /**
     * @brief Pre-order walk over every node, for debug drawing
     */
    void VisitNodes(const NodeVisitor& visitor) const;

    [[nodiscard]] QuadtreeStats GetStats() const;

    [[nodiscard]] QuadtreeNode* GetRoot() const noexcept { return m_root; }
    [[nodiscard]] const Rect& GetWorldBounds() const noexcept { return m_config.worldBounds; }
    [[nodiscard]] const QuadtreeConfig& GetConfig() const noexcept { return m_config; }
    [[nodiscard]] size_t GetNodeCount() const noexcept { return m_nodePool.GetAllocatedCount(); }
    [[nodiscard]] size_t GetMemoryUsage() const noexcept { return m_nodePool.GetMemoryUsage(); }

private:
    friend class QuadtreeNode;

    QuadtreeNode* AllocateNode();
    void DeallocateNode(QuadtreeNode* node);

    void VisitNodesInternal(const QuadtreeNode* node, const NodeVisitor& visitor) const;
    void GetStatsInternal(const QuadtreeNode* node, QuadtreeStats& stats) const;

    QuadtreeConfig m_config;
    BlockPool<QuadtreeNode> m_nodePool;
    QuadtreeNode* m_root = nullptr;
};

} // namespace Quadra
