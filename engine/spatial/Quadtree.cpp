#include "Quadtree.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace Quadra {

namespace {

QuadtreeConfig MakeConfig(const Rect& worldBounds, int maxDepth, size_t maxObjectsPerNode) {
    QuadtreeConfig config;
    config.worldBounds = worldBounds;
    config.maxDepth = maxDepth;
    config.maxObjectsPerNode = maxObjectsPerNode;
    return config;
}

} // anonymous namespace

Quadtree::Quadtree(const QuadtreeConfig& config)
    : m_config(config) {
    if (!m_config.IsValid()) {
        QUADRA_LOG_ERROR("Invalid quadtree config (max_depth={}, max_objects_per_node={})",
                         m_config.maxDepth, m_config.maxObjectsPerNode);
        throw std::invalid_argument("Invalid QuadtreeConfig");
    }

    m_root = AllocateNode();
    m_root->Initialize(this, m_config.worldBounds, 0, m_config.maxDepth, m_config.maxObjectsPerNode);

    QUADRA_LOG_DEBUG("Quadtree created: bounds ({}, {})-({}, {}), max depth {}, {} objects per node",
                     m_config.worldBounds.min.x, m_config.worldBounds.min.y,
                     m_config.worldBounds.max.x, m_config.worldBounds.max.y,
                     m_config.maxDepth, m_config.maxObjectsPerNode);
}

Quadtree::Quadtree(const Rect& worldBounds, int maxDepth, size_t maxObjectsPerNode)
    : Quadtree(MakeConfig(worldBounds, maxDepth, maxObjectsPerNode)) {
}

Quadtree::~Quadtree() {
    Clear();
}

// ============================================================================
// Mutation
// ============================================================================

void Quadtree::Insert(QuadtreeEntry& entry) {
    if (!Intersects(m_root->GetBounds(), entry.GetBounds())) {
        QUADRA_LOG_TRACE("Entry outside quadtree bounds dropped");
        return;
    }
    m_root->Insert(entry);
}

void Quadtree::Reinsert(QuadtreeEntry& entry) {
    entry.RemoveFromAllParents();
    entry.RefreshBounds();
    Insert(entry);
}

void Quadtree::Shake() {
    m_root->Shake();
}

void Quadtree::Clear() {
    if (!m_root->IsLeaf()) {
        m_root->ReleaseChildren();
        m_root->m_state = QuadtreeNode::Leaf{};
    }

    auto& contents = std::get<QuadtreeNode::Leaf>(m_root->m_state).contents;
    for (QuadtreeEntry* entry : contents) {
        entry->RemoveParent(m_root);
    }
    contents.clear();
    m_root->m_layerMask = 0;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<QuadtreeEntry*> Quadtree::Query(const Shape& area) const {
    return m_root->Query(area);
}

void Quadtree::Query(const Shape& area, DedupScope& scope,
                     std::vector<QuadtreeEntry*>& results) const {
    m_root->Query(area, scope, results);
}

std::vector<QuadtreeEntry*> Quadtree::Query(const QuadtreeEntry& querier) const {
    return m_root->Query(querier);
}

void Quadtree::Query(const QuadtreeEntry& querier, DedupScope& scope,
                     std::vector<QuadtreeEntry*>& results) const {
    m_root->Query(querier, scope, results);
}

size_t Quadtree::NumTargets() const {
    return m_root->NumTargets();
}

// ============================================================================
// Inspection
// ============================================================================

void Quadtree::VisitNodes(const NodeVisitor& visitor) const {
    VisitNodesInternal(m_root, visitor);
}

void Quadtree::VisitNodesInternal(const QuadtreeNode* node, const NodeVisitor& visitor) const {
    QuadtreeNodeInfo info;
    info.bounds = node->GetBounds();
    info.depth = node->GetDepth();
    info.isLeaf = node->IsLeaf();
    info.occupantCount = node->NumTargets();
    visitor(info);

    for (const QuadtreeNode* child : node->GetChildren()) {
        VisitNodesInternal(child, visitor);
    }
}

QuadtreeStats Quadtree::GetStats() const {
    QuadtreeStats stats;
    GetStatsInternal(m_root, stats);
    stats.entryCount = m_root->NumTargets();
    return stats;
}

void Quadtree::GetStatsInternal(const QuadtreeNode* node, QuadtreeStats& stats) const {
    ++stats.nodeCount;

    if (node->IsLeaf()) {
        ++stats.leafCount;
        stats.maxDepth = std::max(stats.maxDepth, node->GetDepth());
        return;
    }

    for (const QuadtreeNode* child : node->GetChildren()) {
        GetStatsInternal(child, stats);
    }
}

// ============================================================================
// Node pool
// ============================================================================

QuadtreeNode* Quadtree::AllocateNode() {
    return m_nodePool.Allocate();
}

void Quadtree::DeallocateNode(QuadtreeNode* node) {
    m_nodePool.Deallocate(node);
}

} // namespace Quadra
