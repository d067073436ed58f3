/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for Quadra tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "spatial/Quadtree.hpp"
#include "spatial/QuadtreeEntry.hpp"
#include "spatial/QuadtreeNode.hpp"
#include "mocks/MockCollisionActor.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace Quadra {
namespace Test {

// =============================================================================
// Structural Checks
// =============================================================================

/**
 * @brief Walk a tree and report the first broken structural invariant
 *
 * Checks the two-way link between leaves and entries, the empty contents of
 * internal nodes, the per-leaf layer mask, and the depth cap.
 *
 * @return Empty string when the tree is consistent, otherwise a description
 */
inline std::string CheckTreeInvariants(const QuadtreeNode& node) {
    if (node.GetDepth() >= node.GetMaxDepth()) {
        return "node deeper than max depth";
    }

    if (!node.IsLeaf()) {
        if (!node.GetContents().empty()) {
            return "internal node holds contents";
        }
        if (node.GetLayerMask() != 0) {
            return "internal node has a layer mask";
        }
        for (const QuadtreeNode* child : node.GetChildren()) {
            if (child == nullptr) {
                return "internal node is missing a child";
            }
            if (child->GetDepth() != node.GetDepth() + 1) {
                return "child depth is not parent depth + 1";
            }
            std::string error = CheckTreeInvariants(*child);
            if (!error.empty()) {
                return error;
            }
        }
        return {};
    }

    uint32_t mask = 0;
    for (const QuadtreeEntry* entry : node.GetContents()) {
        const auto& parents = entry->GetParents();
        if (std::find(parents.begin(), parents.end(), &node) == parents.end()) {
            return "leaf entry does not list the leaf as parent";
        }
        if (std::count(node.GetContents().begin(), node.GetContents().end(), entry) != 1) {
            return "entry stored twice in one leaf";
        }
        mask |= entry->GetLayer();
    }

    if (mask != node.GetLayerMask()) {
        return "leaf layer mask out of date";
    }
    return {};
}

/**
 * @brief Check that every parent of an entry is a leaf that stores it
 */
inline bool ParentsHoldEntry(const QuadtreeEntry& entry) {
    for (const QuadtreeNode* parent : entry.GetParents()) {
        if (!parent->IsLeaf()) {
            return false;
        }
        const auto contents = parent->GetContents();
        if (std::find(contents.begin(), contents.end(), &entry) == contents.end()) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Quadtree Test Fixture
// =============================================================================

/**
 * @brief Fixture that owns actors and their entries for tree tests
 *
 * Entries are destroyed before their actors. A tree declared in the test
 * body goes away first and detaches every entry on the way out.
 */
class QuadtreeTestFixture : public ::testing::Test {
protected:
    QuadtreeEntry& AddRect(float x, float y, float width, float height,
                           uint32_t layer = CollisionLayer::Default,
                           uint32_t mask = CollisionLayer::All) {
        return AddShape(Rect::FromPositionSize(x, y, width, height), layer, mask);
    }

    QuadtreeEntry& AddCircle(float cx, float cy, float radius,
                             uint32_t layer = CollisionLayer::Default,
                             uint32_t mask = CollisionLayer::All) {
        return AddShape(Circle(glm::vec2(cx, cy), radius), layer, mask);
    }

    QuadtreeEntry& AddShape(const Shape& shape,
                            uint32_t layer = CollisionLayer::Default,
                            uint32_t mask = CollisionLayer::All) {
        m_actors.push_back(std::make_unique<TestActor>(shape, layer, mask));
        m_entries.push_back(std::make_unique<QuadtreeEntry>(*m_actors.back()));
        return *m_entries.back();
    }

    TestActor& ActorOf(const QuadtreeEntry& entry) {
        return static_cast<TestActor&>(entry.GetActor());
    }

    void ExpectConsistent(const Quadtree& tree) {
        EXPECT_EQ("", CheckTreeInvariants(*tree.GetRoot()));
        for (const auto& entry : m_entries) {
            EXPECT_TRUE(ParentsHoldEntry(*entry));
        }
    }

    std::vector<std::unique_ptr<TestActor>> m_actors;
    std::vector<std::unique_ptr<QuadtreeEntry>> m_entries;
};

} // namespace Test
} // namespace Quadra
