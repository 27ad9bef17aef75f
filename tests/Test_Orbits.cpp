#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

import Core;
import Topology;

#include "TestComplexBuilders.h"

using namespace Topology;

namespace
{
    template <typename Range>
    std::vector<CellId> Collect(const Range& range)
    {
        std::vector<CellId> out;
        for (CellId id : range) out.push_back(id);
        return out;
    }
}

// -----------------------------------------------------------------------------
// FaceBoundary
// -----------------------------------------------------------------------------

TEST(Orbits, FaceBoundaryStartsAtSmallestVertexAndChains)
{
    auto cube = MakeCube();
    const Complex& complex = cube.Loaded;

    // Bottom face is wound 0 -> 3 -> 2 -> 1.
    auto range = Orbits::FaceBoundary(complex, cube.Faces[0]);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->size(), 4u);

    std::vector<CellId> corners;
    for (const Orbits::BoundaryStep& step : *range)
    {
        corners.push_back(step.Vertex);
        EXPECT_EQ(Orbits::StepStart(complex.Graph(), Incidence{step.Edge, step.Sign}), step.Vertex);
    }
    const std::vector<CellId> expected = {cube.Vertices[0], cube.Vertices[3], cube.Vertices[2], cube.Vertices[1]};
    EXPECT_EQ(corners, expected);
}

TEST(Orbits, FaceBoundaryIsRestartable)
{
    auto tet = MakeTetrahedron();
    auto range = Orbits::FaceBoundary(tet.Loaded, tet.Faces[3]);
    ASSERT_TRUE(range.has_value());

    std::vector<Orbits::BoundaryStep> first;
    for (auto it = range->begin(); it != range->end(); ++it) first.push_back(*it);
    std::vector<Orbits::BoundaryStep> second;
    for (const auto& step : *range) second.push_back(step);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 3u);
}

TEST(Orbits, WrongDimensionOrStaleIdFails)
{
    auto tet = MakeTetrahedron();
    auto wrong = Orbits::FaceBoundary(tet.Loaded, tet.Vertices[0]);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().Code, Core::ErrorCode::InvalidArgument);

    auto stale = Orbits::VertexStar(tet.Loaded, CellId(tet.Vertices[0].Index, tet.Vertices[0].Generation + 1));
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().Code, Core::ErrorCode::UnknownCell);
}

// -----------------------------------------------------------------------------
// VertexStar
// -----------------------------------------------------------------------------

TEST(Orbits, VertexStarIsRadialOnClosedSurface)
{
    auto cube = MakeCube();
    const Complex& complex = cube.Loaded;
    const CellId v = cube.Vertices[0];

    auto star = Orbits::VertexStar(complex, v);
    ASSERT_TRUE(star.has_value());
    const auto faces = Collect(*star);
    ASSERT_EQ(faces.size(), 3u);

    // Consecutive faces share an edge at v, including last to first.
    for (std::size_t i = 0; i < faces.size(); ++i)
    {
        const CellId a = faces[i];
        const CellId b = faces[(i + 1) % faces.size()];
        bool shared = false;
        for (const Incidence& e : complex.Graph().Boundary(a))
        {
            const bool atVertex = Orbits::Tail(complex.Graph(), e.Cell) == v || Orbits::Head(complex.Graph(), e.Cell) == v;
            if (atVertex && Orbits::FindStep(complex.Graph(), b, e.Cell)) shared = true;
        }
        EXPECT_TRUE(shared) << "faces " << i << " and " << (i + 1) % faces.size();
    }

    EXPECT_EQ(Collect(*star), faces);
}

TEST(Orbits, VertexStarOfBoundaryVertexIsAFan)
{
    auto grid = MakeQuadGrid();
    const Complex& complex = grid.Loaded;

    auto corner = Orbits::VertexStar(complex, grid.Vertices[0]);
    ASSERT_TRUE(corner.has_value());
    EXPECT_EQ(Collect(*corner).size(), 1u);

    auto side = Orbits::VertexStar(complex, grid.Vertices[1]);
    ASSERT_TRUE(side.has_value());
    auto faces = Collect(*side);
    std::sort(faces.begin(), faces.end());
    std::vector<CellId> expected = {grid.Faces[0], grid.Faces[1]};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(faces, expected);

    auto centre = Orbits::VertexStar(complex, grid.Vertices[4]);
    ASSERT_TRUE(centre.has_value());
    EXPECT_EQ(Collect(*centre).size(), 4u);
}

TEST(Orbits, VertexStarInVolumetricComplexIsAscending)
{
    auto simplex = MakeSimplex4Boundary();
    auto star = Orbits::VertexStar(simplex.Loaded, simplex.Vertices[0]);
    ASSERT_TRUE(star.has_value());
    const auto faces = Collect(*star);
    EXPECT_EQ(faces.size(), 6u);
    EXPECT_TRUE(std::is_sorted(faces.begin(), faces.end()));
}

// -----------------------------------------------------------------------------
// EdgeRing
// -----------------------------------------------------------------------------

TEST(Orbits, EdgeRingOnSurfacePutsPositiveFaceFirst)
{
    auto tet = MakeTetrahedron();
    const Complex& complex = tet.Loaded;
    for (CellId e : complex.AllCells(Dimension::Edge))
    {
        auto ring = Orbits::EdgeRing(complex, e);
        ASSERT_TRUE(ring.has_value());
        ASSERT_EQ(ring->size(), 2u);
        EXPECT_EQ(complex.Graph().FindIncidence((*ring)[0], e), Orientation::Positive);
        EXPECT_EQ(complex.Graph().FindIncidence((*ring)[1], e), Orientation::Negative);
    }
}

TEST(Orbits, EdgeRingOnBoundaryHasOneFace)
{
    auto grid = MakeQuadGrid();
    auto edge = Orbits::FindEdge(grid.Loaded.Graph(), grid.Vertices[0], grid.Vertices[1]);
    ASSERT_TRUE(edge.has_value());
    auto ring = Orbits::EdgeRing(grid.Loaded, *edge);
    ASSERT_TRUE(ring.has_value());
    EXPECT_EQ(ring->size(), 1u);
}

TEST(Orbits, EdgeRingInVolumetricComplexFollowsVolumes)
{
    auto simplex = MakeSimplex4Boundary();
    const Complex& complex = simplex.Loaded;
    const IncidenceGraph& graph = complex.Graph();

    for (CellId e : complex.AllCells(Dimension::Edge))
    {
        auto ring = Orbits::EdgeRing(complex, e);
        ASSERT_TRUE(ring.has_value());
        ASSERT_EQ(ring->size(), 3u);
        for (std::size_t i = 0; i < ring->size(); ++i)
        {
            const CellId a = (*ring)[i];
            const CellId b = (*ring)[(i + 1) % ring->size()];
            const bool shareVolume = std::any_of(graph.Coboundary(a).begin(), graph.Coboundary(a).end(),
                                                 [&](const Incidence& c) { return graph.FindIncidence(c.Cell, b).has_value(); });
            EXPECT_TRUE(shareVolume);
        }
    }
}

// -----------------------------------------------------------------------------
// Star, Closure, Link
// -----------------------------------------------------------------------------

TEST(Orbits, StarClosureAndLinkOfCubeVertex)
{
    auto cube = MakeCube();
    const Complex& complex = cube.Loaded;
    const CellId v = cube.Vertices[0];

    auto star = Orbits::Star(complex, v);
    ASSERT_TRUE(star.has_value());
    EXPECT_EQ(star->size(), 7u); // v, 3 edges, 3 faces
    EXPECT_EQ((*star)[0], v);

    auto closure = Orbits::Closure(complex, cube.Faces[0]);
    ASSERT_TRUE(closure.has_value());
    EXPECT_EQ(closure->size(), 9u); // 4 vertices, 4 edges, the face
    EXPECT_EQ(complex.Graph().DimensionOf((*closure)[8]), Dimension::Face);

    // The link of a cube corner is the hexagon around it.
    auto link = Orbits::Link(complex, v);
    ASSERT_TRUE(link.has_value());
    std::size_t vertices = 0;
    std::size_t edges = 0;
    for (CellId c : *link)
    {
        const Dimension d = complex.Graph().DimensionOf(c);
        if (d == Dimension::Vertex) ++vertices;
        if (d == Dimension::Edge) ++edges;
        EXPECT_NE(c, v);
    }
    EXPECT_EQ(vertices, 6u);
    EXPECT_EQ(edges, 6u);
    EXPECT_EQ(link->size(), 12u);
}

TEST(Orbits, BoundaryLoopsOfGrid)
{
    auto grid = MakeQuadGrid();
    const auto loops = Orbits::BoundaryLoops(grid.Loaded.Graph());
    ASSERT_EQ(loops.size(), 1u);
    EXPECT_EQ(loops[0].size(), 8u);

    const IncidenceGraph& graph = grid.Loaded.Graph();
    for (std::size_t i = 0; i < loops[0].size(); ++i)
    {
        const Incidence& step = loops[0][i];
        const Incidence& next = loops[0][(i + 1) % loops[0].size()];
        EXPECT_EQ(Orbits::StepEnd(graph, step), Orbits::StepStart(graph, next));
    }
    EXPECT_EQ(Orbits::CountComponents(graph), 1u);
}
