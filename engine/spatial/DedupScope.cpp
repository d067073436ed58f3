#include "DedupScope.hpp"
#include "QuadtreeEntry.hpp"

namespace Quadra {

DedupScope::~DedupScope() {
    Reset();
}

bool DedupScope::TryVisit(QuadtreeEntry& entry) {
    if (entry.IsDirty()) {
        return false;
    }

    entry.MarkDirty();
    m_visited.push_back(&entry);
    return true;
}

void DedupScope::Reset() noexcept {
    for (QuadtreeEntry* entry : m_visited) {
        entry->MarkClean();
    }
    m_visited.clear();
}

} // namespace Quadra
