#pragma once

#include <cstddef>
#include <vector>

namespace Quadra {

class QuadtreeEntry;

/**
 * @brief Owner of the dirty flags raised during one traversal
 *
 * An entry straddling several leaves is reached once per leaf. The first
 * TryVisit() marks it dirty and records it; later visits are rejected. All
 * recorded entries are marked clean again by Reset() or when the scope is
 * destroyed, so a traversal cannot leak flags into the next one.
 *
 * Entries marked by a scope must outlive it. Entries already dirty when a
 * scope starts (held by another live scope) are treated as visited.
 */
class DedupScope {
public:
    DedupScope() = default;
    ~DedupScope();

    DedupScope(const DedupScope&) = delete;
    DedupScope& operator=(const DedupScope&) = delete;

    /**
     * @brief Mark an entry on first sight
     * @return true if the entry was clean and is now owned by this scope
     */
    bool TryVisit(QuadtreeEntry& entry);

    /**
     * @brief Clean every entry this scope marked
     */
    void Reset() noexcept;

    [[nodiscard]] size_t GetVisitedCount() const noexcept { return m_visited.size(); }

private:
    std::vector<QuadtreeEntry*> m_visited;
};

} // namespace Quadra
