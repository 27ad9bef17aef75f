module;

#include <algorithm>
#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <unordered_set>
#include <utility>
#include <vector>

module Topology:Euler.Impl;

import Core;
import :Euler;
import :Incidence;
import :Orbits;
import :Transaction;

namespace Topology::Euler
{
    namespace
    {
        [[nodiscard]] std::vector<Incidence> Copy(std::span<const Incidence> list)
        {
            return {list.begin(), list.end()};
        }

        [[nodiscard]] std::vector<CellId> SharedEdges(const IncidenceGraph& graph, CellId f1, CellId f2)
        {
            std::vector<CellId> shared;
            for (const Incidence& a : graph.Boundary(f1))
                if (Orbits::FindStep(graph, f2, a.Cell)) shared.push_back(a.Cell);
            return shared;
        }

        [[nodiscard]] bool SameVolumes(const IncidenceGraph& graph, CellId f1, CellId f2)
        {
            auto a = Copy(graph.Coboundary(f1));
            auto b = Copy(graph.Coboundary(f2));
            if (a.size() != b.size()) return false;
            auto byCell = [](const Incidence& x, const Incidence& y) { return x.Cell < y.Cell; };
            std::sort(a.begin(), a.end(), byCell);
            std::sort(b.begin(), b.end(), byCell);
            return a == b;
        }

        // Moves drop's boundary into keep across their single shared edge and
        // deletes drop and the edge. Preconditions are checked by the caller.
        [[nodiscard]] Result<CellId> MergeAcross(Transaction& tx, CellId keep, CellId drop, CellId shared)
        {
            const IncidenceGraph& graph = tx.Graph();

            if (graph.Coboundary(shared).size() != 2)
            {
                return Fail(Core::ErrorCode::CellInUse,
                            std::format("edge is shared by {} faces", graph.Coboundary(shared).size()),
                            {shared});
            }
            if (!SameVolumes(graph, keep, drop))
            {
                return Fail(Core::ErrorCode::CellInUse, "faces bound different volumes", {keep, drop});
            }

            const CellId tail = Orbits::Tail(graph, shared);
            const CellId head = Orbits::Head(graph, shared);
            const auto keepCorners = Orbits::FaceVertices(graph, keep);
            const std::unordered_set<CellId> corners(keepCorners.begin(), keepCorners.end());
            for (CellId v : Orbits::FaceVertices(graph, drop))
            {
                if (v != tail && v != head && corners.contains(v))
                {
                    return Fail(Core::ErrorCode::DegenerateTopology, "merged face would visit a vertex twice",
                                {keep, drop, v});
                }
            }

            const std::size_t at = *Orbits::FindStep(graph, keep, shared);
            const auto dropBoundary = Copy(graph.Boundary(drop));
            const std::size_t dropAt = *Orbits::FindStep(graph, drop, shared);
            const auto volumes = Copy(graph.Coboundary(drop));

            if (auto s = tx.Unlink(keep, shared); !s) return std::unexpected(std::move(s.error()));

            for (std::size_t j = 1; j < dropBoundary.size(); ++j)
            {
                const Incidence& step = dropBoundary[(dropAt + j) % dropBoundary.size()];
                if (auto s = tx.Unlink(drop, step.Cell); !s) return std::unexpected(std::move(s.error()));
                if (auto s = tx.Link(keep, step.Cell, step.Sign, at + j - 1); !s)
                    return std::unexpected(std::move(s.error()));
            }

            if (auto s = tx.Unlink(drop, shared); !s) return std::unexpected(std::move(s.error()));
            for (const Incidence& c : volumes)
                if (auto s = tx.Unlink(c.Cell, drop); !s) return std::unexpected(std::move(s.error()));
            if (auto s = tx.RemoveCell(drop); !s) return std::unexpected(std::move(s.error()));

            if (auto s = tx.Unlink(shared, tail); !s) return std::unexpected(std::move(s.error()));
            if (auto s = tx.Unlink(shared, head); !s) return std::unexpected(std::move(s.error()));
            if (auto s = tx.RemoveCell(shared); !s) return std::unexpected(std::move(s.error()));

            tx.Touch(tail);
            tx.Touch(head);
            return keep;
        }
    }

    // =========================================================================
    // SplitEdge
    // =========================================================================

    Result<SplitEdgeResult> SplitEdge(Complex& complex, CellId edge)
    {
        Transaction tx(complex, "SplitEdge");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = Require(graph, edge, Dimension::Edge); !s) return std::unexpected(std::move(s.error()));

        const CellId head = Orbits::Head(graph, edge);
        const auto faces = Copy(graph.Coboundary(edge));

        const CellId mid = tx.AddCell(Dimension::Vertex);
        const CellId added = tx.AddCell(Dimension::Edge);

        auto unlinked = tx.Unlink(edge, head);
        if (!unlinked) return std::unexpected(std::move(unlinked.error()));
        if (auto s = tx.Link(edge, mid, Orientation::Positive, unlinked->Position.Boundary); !s)
            return std::unexpected(std::move(s.error()));
        if (auto s = tx.Link(added, mid, Orientation::Negative); !s) return std::unexpected(std::move(s.error()));
        if (auto s = tx.Link(added, head, Orientation::Positive); !s) return std::unexpected(std::move(s.error()));

        // Positive traversal a -> m -> b puts the new edge after e; negative
        // traversal b -> m -> a puts it before.
        for (const Incidence& f : faces)
        {
            const std::size_t step = *Orbits::FindStep(graph, f.Cell, edge);
            const std::size_t pos = f.Sign == Orientation::Positive ? step + 1 : step;
            if (auto s = tx.Link(f.Cell, added, f.Sign, pos); !s) return std::unexpected(std::move(s.error()));
        }

        tx.Expect(0);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return SplitEdgeResult{mid, added};
    }

    // =========================================================================
    // SplitFace
    // =========================================================================

    Result<SplitFaceResult> SplitFace(Complex& complex, CellId face, CellId v1, CellId v2)
    {
        Transaction tx(complex, "SplitFace");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = Require(graph, face, Dimension::Face); !s) return std::unexpected(std::move(s.error()));
        if (auto s = Require(graph, v1, Dimension::Vertex); !s) return std::unexpected(std::move(s.error()));
        if (auto s = Require(graph, v2, Dimension::Vertex); !s) return std::unexpected(std::move(s.error()));

        if (v1 == v2)
            return Fail(Core::ErrorCode::InvalidSplit, "split needs two distinct vertices", {face, v1});

        const auto i1 = Orbits::FindStepFrom(graph, face, v1);
        const auto i2 = Orbits::FindStepFrom(graph, face, v2);
        if (!i1 || !i2)
            return Fail(Core::ErrorCode::InvalidSplit, "vertex is not a corner of the face", {face, v1, v2});
        if (Orbits::FindEdge(graph, v1, v2))
            return Fail(Core::ErrorCode::InvalidSplit, "vertices already share an edge", {face, v1, v2});

        const auto boundary = Copy(graph.Boundary(face));
        const auto volumes = Copy(graph.Coboundary(face));
        const std::size_t k = boundary.size();

        // The new face takes the steps from v2 forward to v1.
        std::vector<Incidence> moved;
        for (std::size_t j = *i2; j != *i1; j = (j + 1) % k) moved.push_back(boundary[j]);

        const CellId diagonal = tx.AddCell(Dimension::Edge);
        if (auto s = tx.Link(diagonal, v1, Orientation::Negative); !s) return std::unexpected(std::move(s.error()));
        if (auto s = tx.Link(diagonal, v2, Orientation::Positive); !s) return std::unexpected(std::move(s.error()));

        const CellId created = tx.AddCell(Dimension::Face);
        for (const Incidence& step : moved)
        {
            if (auto s = tx.Unlink(face, step.Cell); !s) return std::unexpected(std::move(s.error()));
            if (auto s = tx.Link(created, step.Cell, step.Sign); !s) return std::unexpected(std::move(s.error()));
        }
        if (auto s = tx.Link(created, diagonal, Orientation::Positive); !s)
            return std::unexpected(std::move(s.error()));

        // The old face now runs v1 .. v2; close it with v2 -> v1.
        std::size_t pos = 0;
        const auto kept = graph.Boundary(face);
        for (std::size_t j = 0; j < kept.size(); ++j)
            if (Orbits::StepEnd(graph, kept[j]) == v2) pos = j + 1;
        if (auto s = tx.Link(face, diagonal, Orientation::Negative, pos); !s)
            return std::unexpected(std::move(s.error()));

        for (const Incidence& c : volumes)
            if (auto s = tx.Link(c.Cell, created, c.Sign); !s) return std::unexpected(std::move(s.error()));

        tx.Expect(0);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return SplitFaceResult{diagonal, created};
    }

    // =========================================================================
    // MergeFaces / DeleteEdge
    // =========================================================================

    Result<CellId> MergeFaces(Complex& complex, CellId f1, CellId f2)
    {
        Transaction tx(complex, "MergeFaces");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = Require(graph, f1, Dimension::Face); !s) return std::unexpected(std::move(s.error()));
        if (auto s = Require(graph, f2, Dimension::Face); !s) return std::unexpected(std::move(s.error()));
        if (f1 == f2) return Fail(Core::ErrorCode::NotAdjacent, "a face cannot merge with itself", {f1});

        const auto shared = SharedEdges(graph, f1, f2);
        if (shared.size() != 1)
        {
            return Fail(Core::ErrorCode::NotAdjacent, std::format("faces share {} edges", shared.size()),
                        {f1, f2});
        }

        auto merged = MergeAcross(tx, f1, f2, shared.front());
        if (!merged) return merged;

        tx.Expect(0);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return merged;
    }

    Result<CellId> DeleteEdge(Complex& complex, CellId edge)
    {
        Transaction tx(complex, "DeleteEdge");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = Require(graph, edge, Dimension::Edge); !s) return std::unexpected(std::move(s.error()));

        const auto faces = graph.Coboundary(edge);
        if (faces.size() != 2)
        {
            return Fail(Core::ErrorCode::CellInUse,
                        std::format("edge bounds {} faces, deletion needs exactly two", faces.size()), {edge});
        }

        // Keep the face that runs along the edge.
        CellId keep = faces[0].Cell;
        CellId drop = faces[1].Cell;
        if (faces[0].Sign == Orientation::Negative && faces[1].Sign == Orientation::Positive) std::swap(keep, drop);

        if (SharedEdges(graph, keep, drop).size() != 1)
        {
            return Fail(Core::ErrorCode::DegenerateTopology, "faces share more than the deleted edge",
                        {edge, keep, drop});
        }

        auto merged = MergeAcross(tx, keep, drop, edge);
        if (!merged) return merged;

        tx.Expect(0);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return merged;
    }

    // =========================================================================
    // DeleteVertex
    // =========================================================================

    Status DeleteVertex(Complex& complex, CellId vertex)
    {
        Transaction tx(complex, "DeleteVertex");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = Require(graph, vertex, Dimension::Vertex); !s) return s;

        const auto edges = graph.Coboundary(vertex);
        if (edges.size() != 2)
        {
            return Fail(Core::ErrorCode::CellInUse, std::format("vertex bounds {} edges", edges.size()), {vertex});
        }

        // Keep the edge arriving at the vertex so a -> v -> b becomes a -> b.
        CellId keep = edges[0].Cell;
        CellId drop = edges[1].Cell;
        if (Orbits::Head(graph, keep) != vertex && Orbits::Head(graph, drop) == vertex) std::swap(keep, drop);

        const CellId a = Orbits::Opposite(graph, keep, vertex);
        const CellId b = Orbits::Opposite(graph, drop, vertex);
        if (a == b)
            return Fail(Core::ErrorCode::DegenerateTopology, "deletion would create a self-loop", {vertex, a});
        if (Orbits::FindEdge(graph, a, b))
            return Fail(Core::ErrorCode::DegenerateTopology, "deletion would create parallel edges", {vertex, a, b});

        auto keepFaces = Copy(graph.Coboundary(keep));
        auto dropFaces = Copy(graph.Coboundary(drop));
        auto byCell = [](const Incidence& x, const Incidence& y) { return x.Cell < y.Cell; };
        std::sort(keepFaces.begin(), keepFaces.end(), byCell);
        std::sort(dropFaces.begin(), dropFaces.end(), byCell);
        const bool sameFaces = std::equal(keepFaces.begin(), keepFaces.end(), dropFaces.begin(), dropFaces.end(),
                                          [](const Incidence& x, const Incidence& y) { return x.Cell == y.Cell; });
        if (!sameFaces)
        {
            return Fail(Core::ErrorCode::CellInUse, "edges of the vertex bound different faces", {vertex, keep, drop});
        }
        for (const Incidence& f : dropFaces)
        {
            if (graph.Boundary(f.Cell).size() < 4)
            {
                return Fail(Core::ErrorCode::DegenerateTopology, "face would drop below three edges",
                            {vertex, f.Cell});
            }
        }

        for (const Incidence& f : dropFaces)
            if (auto s = tx.Unlink(f.Cell, drop); !s) return std::unexpected(std::move(s.error()));

        auto unlinked = tx.Unlink(keep, vertex);
        if (!unlinked) return std::unexpected(std::move(unlinked.error()));
        if (auto s = tx.Link(keep, b, unlinked->Sign, unlinked->Position.Boundary); !s) return s;

        if (auto s = tx.Unlink(drop, vertex); !s) return std::unexpected(std::move(s.error()));
        if (auto s = tx.Unlink(drop, b); !s) return std::unexpected(std::move(s.error()));
        if (auto s = tx.RemoveCell(drop); !s) return s;
        if (auto s = tx.RemoveCell(vertex); !s) return s;

        tx.Touch(a);
        tx.Touch(b);
        tx.Expect(0);
        return tx.Commit();
    }
}
