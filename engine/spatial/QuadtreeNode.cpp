#include "QuadtreeNode.hpp"
#include "Quadtree.hpp"
#include "QuadtreeEntry.hpp"
#include "DedupScope.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <queue>
#include <stdexcept>
#include <unordered_set>

namespace Quadra {

void QuadtreeNode::Initialize(Quadtree* tree, const Rect& bounds, int depth,
                              int maxDepth, size_t maxObjectsPerNode) {
    m_tree = tree;
    m_bounds = bounds;
    m_depth = depth;
    m_maxDepth = maxDepth;
    m_maxObjectsPerNode = maxObjectsPerNode;
    m_state = Leaf{};
    m_layerMask = 0;
}

template<typename Node, typename Func>
void QuadtreeNode::VisitLeavesBreadthFirst(Node* root, Func&& func) {
    std::queue<Node*> process;
    process.push(root);

    while (!process.empty()) {
        Node* processing = process.front();
        process.pop();

        if (auto* leaf = std::get_if<Leaf>(&processing->m_state)) {
            func(*processing, *leaf);
        } else {
            for (QuadtreeNode* child : std::get<Internal>(processing->m_state).children) {
                process.push(child);
            }
        }
    }
}

// ============================================================================
// Mutation
// ============================================================================

void QuadtreeNode::Insert(QuadtreeEntry& entry) {
    // The entry may still belong to a sibling
    if (!Intersects(m_bounds, entry.GetBounds())) {
        return;
    }

    if (const auto* leaf = std::get_if<Leaf>(&m_state);
        leaf && leaf->contents.size() >= m_maxObjectsPerNode) {
        Split();
    }

    if (std::holds_alternative<Leaf>(m_state)) {
        AddToLeaf(entry);
        return;
    }

    // Straddling entries end up in several children
    for (QuadtreeNode* child : std::get<Internal>(m_state).children) {
        child->Insert(entry);
    }
}

void QuadtreeNode::Remove(QuadtreeEntry& entry) {
    auto* leaf = std::get_if<Leaf>(&m_state);
    if (!leaf) {
        QUADRA_LOG_ERROR("Remove called on internal quadtree node at depth {} "
                         "(stale parent reference)", m_depth);
        throw std::logic_error("Cannot remove from a non-leaf QuadtreeNode");
    }

    auto& contents = leaf->contents;
    contents.erase(std::remove(contents.begin(), contents.end(), &entry), contents.end());
    entry.RemoveParent(this);
    UpdateLayerMask();
}

void QuadtreeNode::Split() {
    auto* leaf = std::get_if<Leaf>(&m_state);
    if (!leaf) {
        return;
    }

    if (m_depth + 1 >= m_maxDepth) {
        QUADRA_LOG_TRACE("Quadtree leaf at depth {} reached the depth cap ({} entries)",
                         m_depth, leaf->contents.size());
        return;
    }

    std::vector<QuadtreeEntry*> contents = std::move(leaf->contents);
    const std::array<Rect, 4> quadrants = m_bounds.Subdivide();

    Internal internal;
    for (size_t i = 0; i < quadrants.size(); ++i) {
        QuadtreeNode* child = m_tree->AllocateNode();
        child->Initialize(m_tree, quadrants[i], m_depth + 1, m_maxDepth, m_maxObjectsPerNode);
        internal.children[i] = child;
    }

    m_state = internal;
    m_layerMask = 0;

    for (QuadtreeEntry* entry : contents) {
        entry->RemoveParent(this);
        for (QuadtreeNode* child : internal.children) {
            child->Insert(*entry);
        }
    }

    QUADRA_LOG_TRACE("Quadtree node split at depth {} ({} entries migrated)",
                     m_depth, contents.size());
}

void QuadtreeNode::Shake() {
    if (IsLeaf()) {
        return;
    }

    // Counted without dirty flags so entries marked by a caller's DedupScope are kept
    std::vector<QuadtreeEntry*> unique = CollectUniqueEntries();

    if (unique.empty()) {
        ReleaseChildren();
        m_state = Leaf{};
        m_layerMask = 0;
        return;
    }

    if (unique.size() < m_maxObjectsPerNode) {
        ReleaseChildren();
        m_state = Leaf{};
        m_layerMask = 0;

        for (QuadtreeEntry* entry : unique) {
            AddToLeaf(*entry);
        }

        QUADRA_LOG_TRACE("Quadtree node at depth {} merged {} entries", m_depth, unique.size());
        return;
    }

    for (QuadtreeNode* child : std::get<Internal>(m_state).children) {
        child->Shake();
    }
}

// ============================================================================
// Traversal
// ============================================================================

size_t QuadtreeNode::NumTargets() const {
    DedupScope scope;

    VisitLeavesBreadthFirst(this, [&scope](const QuadtreeNode&, const Leaf& leaf) {
        for (QuadtreeEntry* entry : leaf.contents) {
            scope.TryVisit(*entry);
        }
    });

    return scope.GetVisitedCount();
}

std::vector<QuadtreeEntry*> QuadtreeNode::Query(const Shape& area) const {
    std::vector<QuadtreeEntry*> results;
    DedupScope scope;
    Query(area, scope, results);
    return results;
}

void QuadtreeNode::Query(const Shape& area, DedupScope& scope,
                         std::vector<QuadtreeEntry*>& results) const {
    if (!Intersects(m_bounds, area)) {
        return;
    }

    if (const auto* leaf = std::get_if<Leaf>(&m_state)) {
        for (QuadtreeEntry* entry : leaf->contents) {
            if (!entry->IsDirty() && Intersects(entry->GetBounds(), area)) {
                scope.TryVisit(*entry);
                results.push_back(entry);
            }
        }
        return;
    }

    for (const QuadtreeNode* child : std::get<Internal>(m_state).children) {
        child->Query(area, scope, results);
    }
}

std::vector<QuadtreeEntry*> QuadtreeNode::Query(const QuadtreeEntry& querier) const {
    std::vector<QuadtreeEntry*> results;
    DedupScope scope;
    Query(querier, scope, results);
    return results;
}

void QuadtreeNode::Query(const QuadtreeEntry& querier, DedupScope& scope,
                         std::vector<QuadtreeEntry*>& results) const {
    const uint32_t mask = querier.GetMask();
    if (mask == 0 || !Intersects(m_bounds, querier.GetBounds())) {
        return;
    }

    if (const auto* leaf = std::get_if<Leaf>(&m_state)) {
        // Nothing in this leaf is on a layer the querier tests against
        if ((mask & m_layerMask) == 0) {
            return;
        }

        for (QuadtreeEntry* entry : leaf->contents) {
            if (!entry->IsDirty() &&
                (mask & entry->GetLayer()) != 0 &&
                Intersects(entry->GetBounds(), querier.GetBounds())) {
                scope.TryVisit(*entry);
                results.push_back(entry);
            }
        }
        return;
    }

    for (const QuadtreeNode* child : std::get<Internal>(m_state).children) {
        child->Query(querier, scope, results);
    }
}

// ============================================================================
// Accessors
// ============================================================================

std::span<QuadtreeEntry* const> QuadtreeNode::GetContents() const noexcept {
    if (const auto* leaf = std::get_if<Leaf>(&m_state)) {
        return leaf->contents;
    }
    return {};
}

std::span<QuadtreeNode* const> QuadtreeNode::GetChildren() const noexcept {
    if (const auto* internal = std::get_if<Internal>(&m_state)) {
        return internal->children;
    }
    return {};
}

QuadtreeNode* QuadtreeNode::GetChild(size_t index) const noexcept {
    const auto children = GetChildren();
    return index < children.size() ? children[index] : nullptr;
}

// ============================================================================
// Internals
// ============================================================================

void QuadtreeNode::AddToLeaf(QuadtreeEntry& entry) {
    auto& contents = std::get<Leaf>(m_state).contents;
    if (std::find(contents.begin(), contents.end(), &entry) == contents.end()) {
        contents.push_back(&entry);
    }

    entry.AddParent(this);
    m_layerMask |= entry.GetLayer();
}

void QuadtreeNode::UpdateLayerMask() {
    m_layerMask = 0;
    if (const auto* leaf = std::get_if<Leaf>(&m_state)) {
        for (const QuadtreeEntry* entry : leaf->contents) {
            m_layerMask |= entry->GetLayer();
        }
    }
}

std::vector<QuadtreeEntry*> QuadtreeNode::CollectUniqueEntries() const {
    std::vector<QuadtreeEntry*> unique;
    std::unordered_set<const QuadtreeEntry*> seen;

    VisitLeavesBreadthFirst(this, [&](const QuadtreeNode&, const Leaf& leaf) {
        for (QuadtreeEntry* entry : leaf.contents) {
            if (seen.insert(entry).second) {
                unique.push_back(entry);
            }
        }
    });

    return unique;
}

void QuadtreeNode::ReleaseChildren() {
    auto* internal = std::get_if<Internal>(&m_state);
    if (!internal) {
        return;
    }

    for (QuadtreeNode*& child : internal->children) {
        if (auto* leaf = std::get_if<Leaf>(&child->m_state)) {
            for (QuadtreeEntry* entry : leaf->contents) {
                entry->RemoveParent(child);
            }
            leaf->contents.clear();
        } else {
            child->ReleaseChildren();
        }

        child->m_state = Leaf{};
        child->m_layerMask = 0;
        m_tree->DeallocateNode(child);
        child = nullptr;
    }
}

} // namespace Quadra
