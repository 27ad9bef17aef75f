#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

import Core;
import Topology;

#include "TestComplexBuilders.h"

using namespace Topology;

namespace
{
    // Two cubes side by side, vertices 0-7 and 8-15, faces 0-5 and 6-11.
    PolygonLoad MakeTwoCubes()
    {
        std::vector<std::vector<std::uint32_t>> faces = {{0, 3, 2, 1}, {4, 5, 6, 7}, {0, 1, 5, 4},
                                                         {1, 2, 6, 5}, {2, 3, 7, 6}, {3, 0, 4, 7}};
        const std::size_t n = faces.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            std::vector<std::uint32_t> shifted;
            for (std::uint32_t v : faces[i]) shifted.push_back(v + 8);
            faces.push_back(std::move(shifted));
        }
        return LoadPolygons(16, faces);
    }
}

TEST(Handles, CubeHandleRaisesGenus)
{
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;
    ASSERT_EQ(Algorithms::Genus(complex).value(), 0);

    auto handle = Euler::CreateHandle(complex, cube.Faces[0], cube.Faces[1], cube.Vertices[0], cube.Vertices[5]);
    ASSERT_TRUE(handle.has_value()) << Describe(handle.error());

    EXPECT_FALSE(handle->JoinedComponents);
    EXPECT_EQ(handle->Edges.size(), 4u);
    EXPECT_EQ(handle->Faces.size(), 4u);
    ExpectCounts(complex, 8, 16, 8);
    EXPECT_EQ(complex.EulerCharacteristic(), 0);
    EXPECT_EQ(complex.Tracked().Components, 1);
    EXPECT_EQ(Algorithms::Genus(complex).value(), 1);
    EXPECT_FALSE(complex.Contains(cube.Faces[0]));
    EXPECT_FALSE(complex.Contains(cube.Faces[1]));
    ExpectValid(complex);
}

TEST(Handles, TubeEdgesFollowAlignment)
{
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;
    auto handle = Euler::CreateHandle(complex, cube.Faces[0], cube.Faces[1], cube.Vertices[0], cube.Vertices[5]);
    ASSERT_TRUE(handle.has_value());

    // Bottom is walked forward from 0, top backward from 5.
    const std::vector<std::pair<std::size_t, std::size_t>> pairs = {{0, 5}, {3, 4}, {2, 7}, {1, 6}};
    for (std::size_t i = 0; i < pairs.size(); ++i)
    {
        const CellId e = handle->Edges[i];
        EXPECT_EQ(Orbits::Tail(complex.Graph(), e), cube.Vertices[pairs[i].first]) << "edge " << i;
        EXPECT_EQ(Orbits::Head(complex.Graph(), e), cube.Vertices[pairs[i].second]) << "edge " << i;
    }
    for (CellId f : handle->Faces) EXPECT_EQ(complex.Graph().Boundary(f).size(), 4u);
}

TEST(Handles, DefaultPairingTurnsToFreeRotation)
{
    // Both faces start at their smallest vertex, 0 and 4, which already share
    // a vertical edge. The top face is turned one step to 5 instead.
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;
    const auto epoch = complex.Epoch();
    auto handle = Euler::CreateHandle(complex, cube.Faces[0], cube.Faces[1]);
    ASSERT_TRUE(handle.has_value()) << Describe(handle.error());

    EXPECT_FALSE(handle->JoinedComponents);
    ExpectCounts(complex, 8, 16, 8);
    EXPECT_EQ(complex.EulerCharacteristic(), 0);
    EXPECT_EQ(Algorithms::Genus(complex).value(), 1);
    EXPECT_EQ(complex.Epoch(), epoch + 1);

    const std::vector<std::pair<std::size_t, std::size_t>> pairs = {{0, 5}, {3, 4}, {2, 7}, {1, 6}};
    for (std::size_t i = 0; i < pairs.size(); ++i)
    {
        const CellId e = handle->Edges[i];
        EXPECT_EQ(Orbits::Tail(complex.Graph(), e), cube.Vertices[pairs[i].first]) << "edge " << i;
        EXPECT_EQ(Orbits::Head(complex.Graph(), e), cube.Vertices[pairs[i].second]) << "edge " << i;
    }
    ExpectValid(complex);
}

TEST(Handles, FullAlignmentOntoExistingEdgeFails)
{
    auto cube = MakeCube();
    const auto epoch = cube.Loaded.Epoch();
    auto handle = Euler::CreateHandle(cube.Loaded, cube.Faces[0], cube.Faces[1], cube.Vertices[0], cube.Vertices[4]);
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().Code, Core::ErrorCode::DegenerateTopology);
    EXPECT_EQ(cube.Loaded.Epoch(), epoch);
    ExpectCounts(cube.Loaded, 8, 12, 6);
    EXPECT_TRUE(cube.Loaded.Contains(cube.Faces[0]));
    ExpectValid(cube.Loaded);
}

TEST(Handles, HandleJoinsComponents)
{
    auto cubes = MakeTwoCubes();
    Complex& complex = cubes.Loaded;
    EXPECT_EQ(complex.Tracked().Components, 2);
    EXPECT_EQ(complex.EulerCharacteristic(), 4);

    auto handle = Euler::CreateHandle(complex, cubes.Faces[1], cubes.Faces[6]);
    ASSERT_TRUE(handle.has_value()) << Describe(handle.error());

    EXPECT_TRUE(handle->JoinedComponents);
    ExpectCounts(complex, 16, 28, 14);
    EXPECT_EQ(complex.Tracked().Components, 1);
    EXPECT_EQ(complex.EulerCharacteristic(), 2);
    EXPECT_EQ(Algorithms::Genus(complex).value(), 0);
    ExpectValid(complex);
}

TEST(Handles, JoinedPillowsThenHandleAgain)
{
    Complex complex(FullCheck());
    auto first = Euler::MakePolygon(complex, 3);
    auto second = Euler::MakePolygon(complex, 3);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(complex.EulerCharacteristic(), 4);

    // Two triangular pillows joined front to front: still a sphere.
    auto joined = Euler::CreateHandle(complex, first->Faces[0], second->Faces[0]);
    ASSERT_TRUE(joined.has_value()) << Describe(joined.error());
    EXPECT_TRUE(joined->JoinedComponents);
    EXPECT_EQ(Algorithms::Genus(complex).value(), 0);

    // The two back faces are now on one sphere: a real handle.
    auto torus = Euler::CreateHandle(complex, first->Faces[1], second->Faces[1], first->Vertices[0],
                                     second->Vertices[1]);
    ASSERT_TRUE(torus.has_value()) << Describe(torus.error());
    EXPECT_FALSE(torus->JoinedComponents);
    EXPECT_EQ(complex.EulerCharacteristic(), 0);
    EXPECT_EQ(Algorithms::Genus(complex).value(), 1);
    ExpectValid(complex);
}

TEST(Handles, SecondPillowHandleWithoutAlignment)
{
    Complex complex(FullCheck());
    auto first = Euler::MakePolygon(complex, 3);
    auto second = Euler::MakePolygon(complex, 3);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    auto joined = Euler::CreateHandle(complex, first->Faces[0], second->Faces[0]);
    ASSERT_TRUE(joined.has_value()) << Describe(joined.error());

    auto torus = Euler::CreateHandle(complex, first->Faces[1], second->Faces[1]);
    ASSERT_TRUE(torus.has_value()) << Describe(torus.error());
    EXPECT_FALSE(torus->JoinedComponents);
    for (CellId e : torus->Edges)
    {
        const CellId tail = Orbits::Tail(complex.Graph(), e);
        const CellId head = Orbits::Head(complex.Graph(), e);
        std::size_t parallel = 0;
        for (CellId other : Orbits::VertexEdges(complex.Graph(), tail))
            if (Orbits::Opposite(complex.Graph(), other, tail) == head) ++parallel;
        EXPECT_EQ(parallel, 1u) << "edge " << e;
    }
    EXPECT_EQ(Algorithms::Genus(complex).value(), 1);
    ExpectValid(complex);
}

TEST(Handles, CopiedComplexTracksComponentsOnItsOwn)
{
    auto cubes = MakeTwoCubes();
    Complex copy(cubes.Loaded);

    auto onCopy = Euler::CreateHandle(copy, cubes.Faces[1], cubes.Faces[6]);
    ASSERT_TRUE(onCopy.has_value()) << Describe(onCopy.error());
    EXPECT_TRUE(onCopy->JoinedComponents);
    EXPECT_EQ(copy.Tracked().Components, 1);

    // The original still has two cubes, and joining them there is a join too.
    EXPECT_EQ(cubes.Loaded.Tracked().Components, 2);
    auto onOriginal = Euler::CreateHandle(cubes.Loaded, cubes.Faces[0], cubes.Faces[7]);
    ASSERT_TRUE(onOriginal.has_value()) << Describe(onOriginal.error());
    EXPECT_TRUE(onOriginal->JoinedComponents);

    // A further handle on the joined copy stays in one component.
    auto again = Euler::CreateHandle(copy, cubes.Faces[0], cubes.Faces[7]);
    ASSERT_TRUE(again.has_value()) << Describe(again.error());
    EXPECT_FALSE(again->JoinedComponents);
    EXPECT_EQ(Algorithms::Genus(copy).value(), 1);
    ExpectValid(copy);
    ExpectValid(cubes.Loaded);
}

TEST(Handles, BoundaryLengthsMustMatch)
{
    auto load = MakeTetrahedron();
    Complex& complex = load.Loaded;
    auto quad = Euler::MakePolygon(complex, 4);
    ASSERT_TRUE(quad.has_value());

    auto handle = Euler::CreateHandle(complex, load.Faces[0], quad->Faces[0]);
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().Code, Core::ErrorCode::IncompatibleBoundary);
}

TEST(Handles, RejectsTouchingOrRepeatedFaces)
{
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;

    auto adjacent = Euler::CreateHandle(complex, cube.Faces[0], cube.Faces[2]);
    ASSERT_FALSE(adjacent.has_value());
    EXPECT_EQ(adjacent.error().Code, Core::ErrorCode::DegenerateTopology);

    auto same = Euler::CreateHandle(complex, cube.Faces[0], cube.Faces[0]);
    ASSERT_FALSE(same.has_value());
    EXPECT_EQ(same.error().Code, Core::ErrorCode::DegenerateTopology);

    auto offFace = Euler::CreateHandle(complex, cube.Faces[0], cube.Faces[1], cube.Vertices[4], cube.Vertices[5]);
    ASSERT_FALSE(offFace.has_value());
    EXPECT_EQ(offFace.error().Code, Core::ErrorCode::IncompatibleBoundary);

    ExpectCounts(complex, 8, 12, 6);
    ExpectValid(complex);
}

TEST(Handles, VolumetricComplexHasNoHandles)
{
    auto simplex = MakeSimplex4Boundary();
    const auto triangles = simplex.Loaded.AllCells(Dimension::Face);
    auto handle = Euler::CreateHandle(simplex.Loaded, triangles[0], triangles[9]);
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().Code, Core::ErrorCode::InvalidState);

    auto genus = Algorithms::Genus(simplex.Loaded);
    ASSERT_FALSE(genus.has_value());
    EXPECT_EQ(genus.error().Code, Core::ErrorCode::InvalidState);
}
