#include "QuadtreeEntry.hpp"
#include "QuadtreeNode.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace Quadra {

QuadtreeEntry::QuadtreeEntry(ICollisionActor& actor)
    : m_actor(&actor)
    , m_bounds(actor.GetBounds())
    , m_layer(actor.GetLayer())
    , m_mask(actor.GetMask())
    , m_previousPosition(GetPosition(m_bounds)) {
}

QuadtreeEntry::~QuadtreeEntry() {
    // Parents are always leaves in a consistent tree, so Remove cannot throw here
    RemoveFromAllParents();
}

bool QuadtreeEntry::IsPositionDirty() const {
    return GetPosition(m_actor->GetBounds()) != m_previousPosition;
}

void QuadtreeEntry::RefreshBounds() {
    if (IsAttached()) {
        QUADRA_LOG_ERROR("RefreshBounds called on an entry still held by {} node(s)", m_parents.size());
        throw std::logic_error("Cannot refresh bounds of an attached QuadtreeEntry");
    }

    m_bounds = m_actor->GetBounds();
    m_layer = m_actor->GetLayer();
    m_mask = m_actor->GetMask();
    m_previousPosition = GetPosition(m_bounds);
}

void QuadtreeEntry::AddParent(QuadtreeNode* parent) {
    if (std::find(m_parents.begin(), m_parents.end(), parent) == m_parents.end()) {
        m_parents.push_back(parent);
    }
}

void QuadtreeEntry::RemoveParent(QuadtreeNode* parent) {
    auto it = std::find(m_parents.begin(), m_parents.end(), parent);
    if (it != m_parents.end()) {
        *it = m_parents.back();
        m_parents.pop_back();
    }
}

void QuadtreeEntry::RemoveFromAllParents() {
    // QuadtreeNode::Remove unlinks the parent through RemoveParent; if it throws,
    // the parents not yet visited keep both directions of the link
    while (!m_parents.empty()) {
        m_parents.back()->Remove(*this);
    }
}

} // namespace Quadra
