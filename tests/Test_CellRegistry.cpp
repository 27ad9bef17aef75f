#include <gtest/gtest.h>
#include <string>

import Core;
import Topology;

using namespace Topology;

// -----------------------------------------------------------------------------
// Allocation and generations
// -----------------------------------------------------------------------------

TEST(CellRegistry, CreateCountsPerDimension)
{
    CellRegistry registry;
    const CellId v0 = registry.Create(Dimension::Vertex);
    const CellId v1 = registry.Create(Dimension::Vertex);
    const CellId e = registry.Create(Dimension::Edge);

    EXPECT_NE(v0, v1);
    EXPECT_EQ(registry.Count(Dimension::Vertex), 2u);
    EXPECT_EQ(registry.Count(Dimension::Edge), 1u);
    EXPECT_EQ(registry.Count(Dimension::Face), 0u);
    EXPECT_EQ(registry.LiveCount(), 3u);
    EXPECT_EQ(registry.DimensionOf(e), Dimension::Edge);
}

TEST(CellRegistry, DestroyedIdIsRejected)
{
    CellRegistry registry;
    const CellId v = registry.Create(Dimension::Vertex);
    ASSERT_TRUE(registry.Destroy(v).has_value());

    EXPECT_FALSE(registry.Contains(v));
    auto lookup = registry.Lookup(v);
    ASSERT_FALSE(lookup.has_value());
    EXPECT_EQ(lookup.error().Code, Core::ErrorCode::UnknownCell);

    auto again = registry.Destroy(v);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().Code, Core::ErrorCode::UnknownCell);
}

TEST(CellRegistry, NeverAllocatedIdIsRejected)
{
    CellRegistry registry;
    auto lookup = registry.Lookup(CellId(12, 1));
    ASSERT_FALSE(lookup.has_value());
    EXPECT_EQ(lookup.error().Code, Core::ErrorCode::UnknownCell);
    EXPECT_FALSE(registry.Lookup(CellId()).has_value());
}

TEST(CellRegistry, ReusedSlotGetsNewGeneration)
{
    CellRegistry registry;
    const CellId old = registry.Create(Dimension::Vertex);
    ASSERT_TRUE(registry.Destroy(old).has_value());

    const CellId reused = registry.Create(Dimension::Face);
    EXPECT_EQ(reused.Index, old.Index);
    EXPECT_GT(reused.Generation, old.Generation);
    EXPECT_FALSE(registry.Contains(old));
    EXPECT_TRUE(registry.Contains(reused));
    EXPECT_EQ(registry.DimensionOf(reused), Dimension::Face);
}

TEST(CellRegistry, FreedSlotsAreReusedInOrder)
{
    CellRegistry registry;
    const CellId a = registry.Create(Dimension::Vertex);
    const CellId b = registry.Create(Dimension::Vertex);
    ASSERT_TRUE(registry.Destroy(b).has_value());
    ASSERT_TRUE(registry.Destroy(a).has_value());

    EXPECT_EQ(registry.Create(Dimension::Vertex).Index, b.Index);
    EXPECT_EQ(registry.Create(Dimension::Vertex).Index, a.Index);
}

TEST(CellRegistry, DestroyWithReferencesFails)
{
    CellRegistry registry;
    const CellId v = registry.Create(Dimension::Vertex);
    registry.Retain(v);

    auto destroyed = registry.Destroy(v);
    ASSERT_FALSE(destroyed.has_value());
    EXPECT_EQ(destroyed.error().Code, Core::ErrorCode::DanglingReference);
    EXPECT_TRUE(registry.Contains(v));

    registry.Release(v);
    EXPECT_EQ(registry.ReferenceCount(v), 0u);
    EXPECT_TRUE(registry.Destroy(v).has_value());
}

// -----------------------------------------------------------------------------
// Undo
// -----------------------------------------------------------------------------

TEST(CellRegistry, UndoCreateRestoresCapacity)
{
    CellRegistry registry;
    (void)registry.Create(Dimension::Vertex);
    const CellId e = registry.Create(Dimension::Edge);
    registry.UndoCreate(e);

    EXPECT_EQ(registry.Capacity(), 1u);
    EXPECT_EQ(registry.Count(Dimension::Edge), 0u);
}

TEST(CellRegistry, UndoDestroyRevivesSameId)
{
    CellRegistry registry;
    const CellId v = registry.Create(Dimension::Vertex);
    ASSERT_TRUE(registry.Destroy(v).has_value());
    registry.UndoDestroy(v);

    EXPECT_TRUE(registry.Contains(v));
    EXPECT_EQ(registry.Count(Dimension::Vertex), 1u);

    // The free list is back to empty: the next create appends.
    EXPECT_EQ(registry.Create(Dimension::Vertex).Index, 1u);
}

// -----------------------------------------------------------------------------
// Enumeration and payload
// -----------------------------------------------------------------------------

TEST(CellRegistry, AllReturnsAscendingLiveIds)
{
    CellRegistry registry;
    const CellId a = registry.Create(Dimension::Vertex);
    (void)registry.Create(Dimension::Edge);
    const CellId b = registry.Create(Dimension::Vertex);
    const CellId c = registry.Create(Dimension::Vertex);
    ASSERT_TRUE(registry.Destroy(b).has_value());

    const auto all = registry.All(Dimension::Vertex);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], a);
    EXPECT_EQ(all[1], c);
}

TEST(CellRegistry, PayloadStoredAndResetOnReuse)
{
    CellRegistry registry;
    auto weight = registry.Attributes().Add<float>("v:weight", -1.0f);
    ASSERT_TRUE(weight.IsValid());

    const CellId v = registry.Create(Dimension::Vertex);
    EXPECT_FLOAT_EQ(weight[v], -1.0f);
    weight[v] = 3.5f;
    EXPECT_FLOAT_EQ(weight[v], 3.5f);

    ASSERT_TRUE(registry.Destroy(v).has_value());
    const CellId reused = registry.Create(Dimension::Vertex);
    ASSERT_EQ(reused.Index, v.Index);
    EXPECT_FLOAT_EQ(weight[reused], -1.0f);
}

TEST(CellRegistry, PayloadNamesAreUniquePerType)
{
    CellRegistry registry;
    PropertySet& attributes = registry.Attributes();
    EXPECT_TRUE(attributes.Add<int>("c:label").IsValid());
    EXPECT_FALSE(attributes.Add<int>("c:label").IsValid());
    EXPECT_FALSE(attributes.Get<float>("c:label").IsValid());
    EXPECT_TRUE(attributes.Get<int>("c:label").IsValid());
    EXPECT_TRUE(attributes.Exists("c:label"));

    auto tag = attributes.GetOrAdd<std::string>("c:tag", "none");
    const CellId c = registry.Create(Dimension::Face);
    EXPECT_EQ(tag[c], "none");

    EXPECT_TRUE(attributes.Remove(tag));
    EXPECT_FALSE(attributes.Exists("c:tag"));
}

// -----------------------------------------------------------------------------
// Journal support
// -----------------------------------------------------------------------------

TEST(CellRegistry, UndoWhileHeldRestoresDimensionAndPayload)
{
    CellRegistry registry;
    auto label = registry.Attributes().Add<int>("c:label", 0);
    const CellId face = registry.Create(Dimension::Face);
    label[face] = 7;

    registry.HoldFreedSlots();
    ASSERT_TRUE(registry.Destroy(face).has_value());
    const CellId edge = registry.Create(Dimension::Edge);
    EXPECT_NE(edge.Index, face.Index);

    registry.UndoCreate(edge);
    registry.UndoDestroy(face);
    registry.ReleaseHeldSlots();

    EXPECT_TRUE(registry.Contains(face));
    EXPECT_EQ(registry.DimensionOf(face), Dimension::Face);
    EXPECT_EQ(registry.Count(Dimension::Face), 1u);
    EXPECT_EQ(registry.Count(Dimension::Edge), 0u);
    EXPECT_EQ(registry.Capacity(), 1u);
    EXPECT_EQ(label[face], 7);
}

TEST(CellRegistry, HeldSlotsAreRecycledAfterRelease)
{
    CellRegistry registry;
    const CellId a = registry.Create(Dimension::Vertex);

    registry.HoldFreedSlots();
    EXPECT_TRUE(registry.HoldsFreedSlots());
    ASSERT_TRUE(registry.Destroy(a).has_value());
    const CellId b = registry.Create(Dimension::Vertex);
    EXPECT_NE(b.Index, a.Index);
    registry.ReleaseHeldSlots();
    EXPECT_FALSE(registry.HoldsFreedSlots());

    const CellId c = registry.Create(Dimension::Edge);
    EXPECT_EQ(c.Index, a.Index);
    EXPECT_EQ(c.Generation, a.Generation + 1);
    EXPECT_FALSE(registry.Contains(a));
}
