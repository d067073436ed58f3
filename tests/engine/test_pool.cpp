/**
 * @file test_pool.cpp
 * @brief Unit tests for the block pool backing quadtree nodes
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Pool.hpp"

#include "utils/TestHelpers.hpp"

#include <set>
#include <vector>

using namespace Quadra;
using namespace Quadra::Test;

// =============================================================================
// Test Object Types
// =============================================================================

struct SimpleObject {
    int id = 0;
    float value = 0.0f;
};

// =============================================================================
// BlockPool Tests
// =============================================================================

class BlockPoolTest : public ::testing::Test {
protected:
    static constexpr size_t kBlockSize = 8;
    using TestPool = BlockPool<SimpleObject, kBlockSize>;
};

TEST_F(BlockPoolTest, StartsEmpty) {
    TestPool pool;

    EXPECT_EQ(0u, pool.GetAllocatedCount());
    EXPECT_EQ(0u, pool.GetMemoryUsage());
}

TEST_F(BlockPoolTest, MemoryGrowsOneBlockAtATime) {
    TestPool pool;

    (void)pool.Allocate();
    const size_t oneBlock = pool.GetMemoryUsage();
    EXPECT_GE(oneBlock, kBlockSize * sizeof(SimpleObject));

    for (size_t i = 1; i < kBlockSize; ++i) {
        (void)pool.Allocate();
    }
    EXPECT_EQ(oneBlock, pool.GetMemoryUsage());

    (void)pool.Allocate();
    EXPECT_GE(pool.GetMemoryUsage(), oneBlock + kBlockSize * sizeof(SimpleObject));
    EXPECT_EQ(kBlockSize + 1, pool.GetAllocatedCount());
}

TEST_F(BlockPoolTest, AllocationsAreDistinctAcrossBlocks) {
    TestPool pool;
    std::set<SimpleObject*> unique;

    for (size_t i = 0; i < kBlockSize * 3 + 1; ++i) {
        unique.insert(pool.Allocate());
    }

    EXPECT_EQ(kBlockSize * 3 + 1, unique.size());
    EXPECT_EQ(kBlockSize * 3 + 1, pool.GetAllocatedCount());
}

TEST_F(BlockPoolTest, FreshBlockHandsOutSlotsInOrder) {
    TestPool pool;

    SimpleObject* first = pool.Allocate();
    SimpleObject* second = pool.Allocate();

    EXPECT_EQ(first + 1, second);
}

TEST_F(BlockPoolTest, AddressesStayStableAcrossGrowth) {
    TestPool pool;

    SimpleObject* obj = pool.Allocate();
    obj->id = 42;
    obj->value = 3.5f;

    for (size_t i = 0; i < kBlockSize * 10; ++i) {
        (void)pool.Allocate();
    }

    EXPECT_EQ(42, obj->id);
    EXPECT_FLOAT_EQ(3.5f, obj->value);
}

TEST_F(BlockPoolTest, ReleasedSlotIsReusedBeforeGrowing) {
    TestPool pool;

    SimpleObject* a = pool.Allocate();
    (void)pool.Allocate();
    const size_t memory = pool.GetMemoryUsage();

    pool.Deallocate(a);
    EXPECT_EQ(1u, pool.GetAllocatedCount());

    EXPECT_EQ(a, pool.Allocate());
    EXPECT_EQ(2u, pool.GetAllocatedCount());
    EXPECT_EQ(memory, pool.GetMemoryUsage());
}

TEST_F(BlockPoolTest, DeallocateNullIsIgnored) {
    TestPool pool;
    (void)pool.Allocate();

    pool.Deallocate(nullptr);

    EXPECT_EQ(1u, pool.GetAllocatedCount());
}

TEST_F(BlockPoolTest, ReleasedSlotKeepsItsValue) {
    TestPool pool;

    SimpleObject* obj = pool.Allocate();
    obj->id = 7;
    pool.Deallocate(obj);

    // Slots are not reset on release; callers reinitialize after Allocate()
    SimpleObject* again = pool.Allocate();
    ASSERT_EQ(obj, again);
    EXPECT_EQ(7, again->id);
}
