/**
 * @file test_tick_loop.cpp
 * @brief Integration tests: randomized per-tick reinsertion checked against brute force
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "spatial/Quadtree.hpp"
#include "spatial/QuadtreeEntry.hpp"
#include "spatial/DedupScope.hpp"

#include "utils/TestFixtures.hpp"
#include "utils/TestHelpers.hpp"
#include "utils/Generators.hpp"

#include <algorithm>
#include <memory>
#include <vector>

using namespace Quadra;
using namespace Quadra::Test;

// =============================================================================
// Tick Loop Integration Test Fixture
// =============================================================================

class TickLoopIntegrationTest : public QuadtreeTestFixture {
protected:
    static constexpr size_t kActorCount = 300;
    static constexpr float kMargin = 10.0f;
    static constexpr float kMaxSize = 10.0f;

    void SetUp() override {
        tree = std::make_unique<Quadtree>(Rect::FromPositionSize(0.0f, 0.0f, 1000.0f, 1000.0f), 6, 4);

        // Keep every shape strictly inside the world
        spawnArea = Rect(glm::vec2(kMargin), glm::vec2(1000.0f - kMargin - kMaxSize));

        ShapeGenerator shapes(spawnArea, 1.0f, kMaxSize);
        std::uniform_int_distribution<uint32_t> maskDist(0, (1u << 10) - 1);

        for (size_t i = 0; i < kActorCount; ++i) {
            const uint32_t layer = 1u << (i % 10);
            tree->Insert(AddShape(shapes.Generate(rng), layer, maskDist(rng.Engine())));
        }
    }

    void TearDown() override {
        tree.reset();
    }

    std::vector<QuadtreeEntry*> BruteForce(const Shape& area) const {
        std::vector<QuadtreeEntry*> results;
        for (const auto& entry : m_entries) {
            if (Intersects(entry->GetBounds(), area)) {
                results.push_back(entry.get());
            }
        }
        return results;
    }

    std::vector<QuadtreeEntry*> BruteForce(const QuadtreeEntry& querier) const {
        std::vector<QuadtreeEntry*> results;
        if (querier.GetMask() == 0) {
            return results;
        }
        for (const auto& entry : m_entries) {
            if ((querier.GetMask() & entry->GetLayer()) != 0 &&
                Intersects(entry->GetBounds(), querier.GetBounds())) {
                results.push_back(entry.get());
            }
        }
        return results;
    }

    void MoveSomeActors() {
        std::uniform_real_distribution<float> step(-20.0f, 20.0f);
        std::uniform_int_distribution<int> pick(0, 2);

        for (auto& actor : m_actors) {
            if (pick(rng.Engine()) != 0) {
                continue;
            }
            glm::vec2 pos = actor->GetPosition() + glm::vec2(step(rng.Engine()), step(rng.Engine()));
            pos = glm::clamp(pos, spawnArea.min, spawnArea.max);
            actor->MoveTo(pos.x, pos.y);
        }
    }

    size_t ReinsertDirty() {
        size_t moved = 0;
        for (const auto& entry : m_entries) {
            if (entry->IsPositionDirty()) {
                tree->Reinsert(*entry);
                ++moved;
            }
        }
        return moved;
    }

    void VerifyAgainstBruteForce() {
        RectGenerator queries(spawnArea, 5.0f, 120.0f);
        for (int i = 0; i < 30; ++i) {
            const Shape area = queries.Generate(rng);
            auto results = tree->Query(area);
            EXPECT_TRUE(AllUnique(results));
            EXPECT_TRUE(SameElements(BruteForce(area), results));
        }

        for (size_t i = 0; i < m_entries.size(); i += 15) {
            const QuadtreeEntry& querier = *m_entries[i];
            auto results = tree->Query(querier);
            EXPECT_TRUE(AllUnique(results));
            EXPECT_TRUE(SameElements(BruteForce(querier), results));
        }

        EXPECT_EQ(kActorCount, tree->NumTargets());
        ExpectConsistent(*tree);
    }

    RandomGenerator rng{20261018};
    Rect spawnArea;
    std::unique_ptr<Quadtree> tree;
};

// =============================================================================
// Tests
// =============================================================================

TEST_F(TickLoopIntegrationTest, InitialTreeMatchesBruteForce) {
    EXPECT_FALSE(tree->GetRoot()->IsLeaf());
    VerifyAgainstBruteForce();
}

TEST_F(TickLoopIntegrationTest, ReinsertEveryTick) {
    for (int tick = 0; tick < 20; ++tick) {
        MoveSomeActors();
        const size_t moved = ReinsertDirty();
        EXPECT_GT(moved, 0u);

        if (tick % 5 == 4) {
            tree->Shake();
        }

        VerifyAgainstBruteForce();
        for (const auto& entry : m_entries) {
            EXPECT_FALSE(entry->IsPositionDirty());
            EXPECT_FALSE(entry->IsDirty());
        }
    }
}

TEST_F(TickLoopIntegrationTest, ShakeAfterMassRemoval) {
    const size_t nodesBefore = tree->GetNodeCount();

    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (i % 20 != 0) {
            m_entries[i]->RemoveFromAllParents();
        }
    }

    tree->Shake();

    const size_t remaining = (kActorCount + 19) / 20;
    EXPECT_EQ(remaining, tree->NumTargets());
    EXPECT_LT(tree->GetNodeCount(), nodesBefore);
    EXPECT_EQ(tree->GetNodeCount(), tree->GetStats().nodeCount);
    EXPECT_EQ("", CheckTreeInvariants(*tree->GetRoot()));

    for (size_t i = 0; i < m_entries.size(); i += 20) {
        auto results = tree->Query(m_entries[i]->GetBounds());
        EXPECT_TRUE(Contains(results, m_entries[i].get()));
    }
}

TEST_F(TickLoopIntegrationTest, ScopedSweepReportsEachEntryOnce) {
    DedupScope scope;
    std::vector<QuadtreeEntry*> results;

    // Overlapping strips cover the whole world
    for (int i = 0; i < 10; ++i) {
        tree->Query(Rect::FromPositionSize(0.0f, i * 100.0f - 20.0f, 1000.0f, 140.0f),
                    scope, results);
    }

    EXPECT_EQ(kActorCount, results.size());
    EXPECT_TRUE(AllUnique(results));
    EXPECT_EQ(kActorCount, scope.GetVisitedCount());
}
