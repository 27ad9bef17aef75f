#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

import Core;
import Topology;

#include "TestComplexBuilders.h"

using namespace Topology;

TEST(Transaction, FailedCommitRestoresComplex)
{
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;
    auto label = complex.Attributes().Add<int>("f:label", 0);
    const CellId face = cube.Faces[3];
    label[face] = 7;

    const ComplexDump before = complex.Dump();
    const auto epoch = complex.Epoch();
    {
        Euler::Transaction tx(complex, "RemoveRightFace");
        const std::vector<Incidence> steps(tx.Graph().Boundary(face).begin(), tx.Graph().Boundary(face).end());
        for (const Incidence& step : steps) ASSERT_TRUE(tx.Unlink(face, step.Cell).has_value());
        ASSERT_TRUE(tx.RemoveCell(face).has_value());

        // The freed face slot is not handed out again inside the edit.
        const CellId dangling = tx.AddCell(Dimension::Edge);
        EXPECT_NE(dangling.Index, face.Index);

        auto status = tx.Commit();
        ASSERT_FALSE(status.has_value());
        EXPECT_EQ(status.error().Code, Core::ErrorCode::TopologyError);
    }

    EXPECT_EQ(complex.Epoch(), epoch);
    EXPECT_TRUE(complex.Contains(face));
    EXPECT_EQ(complex.DimensionOf(face).value(), Dimension::Face);
    EXPECT_EQ(label[face], 7);
    ExpectCounts(complex, 8, 12, 6);
    EXPECT_EQ(complex.EulerCharacteristic(), 2);
    ExpectSameStructure(before, complex.Dump());
    ExpectValid(complex);
}

TEST(Transaction, UncommittedEditRollsBackOnScopeExit)
{
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;
    const ComplexDump before = complex.Dump();
    const auto epoch = complex.Epoch();

    CellId added;
    {
        Euler::Transaction tx(complex, "Abandoned");
        const Incidence first = tx.Graph().Boundary(cube.Faces[0]).front();
        ASSERT_TRUE(tx.Unlink(cube.Faces[0], first.Cell).has_value());
        added = tx.AddCell(Dimension::Vertex);
        EXPECT_TRUE(complex.Contains(added));
    }

    EXPECT_FALSE(complex.Contains(added));
    EXPECT_EQ(complex.Epoch(), epoch);
    ExpectSameStructure(before, complex.Dump());
    ExpectValid(complex);
}

TEST(Transaction, ExplicitRollbackUndoesRemovals)
{
    auto load = MakeTetrahedron();
    Complex& complex = load.Loaded;
    const ComplexDump before = complex.Dump();

    Euler::Transaction tx(complex, "Discard");
    const std::vector<Incidence> steps(tx.Graph().Boundary(load.Faces[2]).begin(),
                                       tx.Graph().Boundary(load.Faces[2]).end());
    for (const Incidence& step : steps) ASSERT_TRUE(tx.Unlink(load.Faces[2], step.Cell).has_value());
    ASSERT_TRUE(tx.RemoveCell(load.Faces[2]).has_value());
    EXPECT_FALSE(complex.Contains(load.Faces[2]));
    tx.Rollback();

    EXPECT_TRUE(complex.Contains(load.Faces[2]));
    ExpectSameStructure(before, complex.Dump());
}

TEST(Transaction, ComposedEditCommits)
{
    Complex complex(FullCheck());
    const auto epoch = complex.Epoch();

    std::vector<CellId> corners;
    std::vector<CellId> sides;
    {
        Euler::Transaction tx(complex, "Triangle");
        for (int i = 0; i < 3; ++i) corners.push_back(tx.AddCell(Dimension::Vertex));
        for (std::size_t i = 0; i < 3; ++i)
        {
            const CellId e = tx.AddCell(Dimension::Edge);
            ASSERT_TRUE(tx.Link(e, corners[i], Orientation::Negative).has_value());
            ASSERT_TRUE(tx.Link(e, corners[(i + 1) % 3], Orientation::Positive).has_value());
            sides.push_back(e);
        }
        const CellId face = tx.AddCell(Dimension::Face);
        for (CellId e : sides) ASSERT_TRUE(tx.Link(face, e, Orientation::Positive).has_value());

        tx.Expect(+1, +1, +1);
        auto status = tx.Commit();
        ASSERT_TRUE(status.has_value()) << Describe(status.error());
    }

    EXPECT_EQ(complex.Epoch(), epoch + 1);
    ExpectCounts(complex, 3, 3, 1);
    EXPECT_EQ(complex.EulerCharacteristic(), 1);
    EXPECT_EQ(complex.Tracked().Components, 1);
    EXPECT_EQ(complex.Tracked().BoundaryLoops, 1);
    ExpectValid(complex);
}

TEST(Transaction, WrongDeclaredChangeIsRejectedUnderFullValidation)
{
    Complex complex(FullCheck());
    {
        Euler::Transaction tx(complex, "LoneVertex");
        [[maybe_unused]] const CellId v = tx.AddCell(Dimension::Vertex);
        tx.Expect(+1);
        auto status = tx.Commit();
        ASSERT_FALSE(status.has_value());
        EXPECT_EQ(status.error().Code, Core::ErrorCode::TopologyError);
    }
    EXPECT_TRUE(complex.Empty());
    EXPECT_EQ(complex.EulerCharacteristic(), 0);
    EXPECT_EQ(complex.Tracked().Components, 0);
}

TEST(Transaction, RolledBackJoinLeavesComponentsApart)
{
    Complex complex(FullCheck());
    auto first = Euler::MakePolygon(complex, 3);
    auto second = Euler::MakePolygon(complex, 3);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    CellId bridge;
    {
        Euler::Transaction tx(complex, "Bridge");
        EXPECT_FALSE(tx.SameComponent(first->Vertices[0], second->Vertices[0]));
        EXPECT_TRUE(tx.SameComponent(first->Vertices[0], first->Vertices[2]));

        bridge = tx.AddCell(Dimension::Edge);
        ASSERT_TRUE(tx.Link(bridge, first->Vertices[0], Orientation::Negative).has_value());
        ASSERT_TRUE(tx.Link(bridge, second->Vertices[0], Orientation::Positive).has_value());

        // Joins become visible only once the edit commits.
        EXPECT_FALSE(tx.SameComponent(first->Vertices[0], second->Vertices[0]));
    }

    EXPECT_FALSE(complex.Contains(bridge));
    EXPECT_EQ(complex.Tracked().Components, 2);

    auto handle = Euler::CreateHandle(complex, first->Faces[0], second->Faces[0]);
    ASSERT_TRUE(handle.has_value()) << Describe(handle.error());
    EXPECT_TRUE(handle->JoinedComponents);
    EXPECT_EQ(complex.Tracked().Components, 1);
    ExpectValid(complex);
}

TEST(Transaction, CleanRollbackLogsWarningOnly)
{
    Complex complex(FullCheck());
    const auto level = Core::Log::MinimumLevel();
    Core::Log::SetMinimumLevel(Core::Log::Level::Warning);
    std::ostringstream err;
    std::streambuf* old = std::cerr.rdbuf(err.rdbuf());
    {
        Euler::Transaction tx(complex, "Dangling");
        const CellId v = tx.AddCell(Dimension::Vertex);
        const CellId e = tx.AddCell(Dimension::Edge);
        EXPECT_TRUE(tx.Link(e, v, Orientation::Negative).has_value());
        EXPECT_FALSE(tx.Commit().has_value());
    }
    std::cerr.rdbuf(old);
    Core::Log::SetMinimumLevel(level);

    // Every journal entry replayed cleanly: no rollback error was reported.
    EXPECT_NE(err.str().find("Dangling: rolled back"), std::string::npos);
    EXPECT_EQ(err.str().find("[ERR]"), std::string::npos);
    EXPECT_TRUE(complex.Empty());
}
