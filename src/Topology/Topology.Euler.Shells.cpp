module;

#include <algorithm>
#include <cstddef>
#include <deque>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

module Topology:Euler.Shells.Impl;

import Core;
import :Euler;
import :Incidence;
import :Orbits;
import :Transaction;

namespace Topology::Euler
{
    namespace
    {
        [[nodiscard]] bool OnBoundary(const IncidenceGraph& graph, CellId vertex)
        {
            for (const Incidence& e : graph.Coboundary(vertex))
                if (graph.Coboundary(e.Cell).size() < 2) return true;
            return false;
        }

        // Unlinks and removes a face that bounds no volume. Returns its edges
        // in traversal order from the canonical start.
        [[nodiscard]] Result<std::vector<CellId>> RemoveFace(Transaction& tx, CellId face)
        {
            const IncidenceGraph& graph = tx.Graph();
            if (!graph.Coboundary(face).empty())
            {
                return Fail(Core::ErrorCode::CellInUse,
                            std::format("face bounds {} volumes", graph.Coboundary(face).size()), {face});
            }

            const auto boundary = graph.Boundary(face);
            const std::size_t start = Orbits::CanonicalStart(graph, face);
            std::vector<CellId> edges;
            edges.reserve(boundary.size());
            for (std::size_t i = 0; i < boundary.size(); ++i)
                edges.push_back(boundary[(start + i) % boundary.size()].Cell);

            if (tx.Target().Kind() == ComplexKind::Surface)
            {
                for (CellId e : edges)
                {
                    if (graph.Coboundary(e).size() < 2)
                    {
                        return Fail(Core::ErrorCode::DegenerateTopology, "hole would merge with a boundary edge",
                                    {face, e});
                    }
                }
                for (CellId v : Orbits::FaceVertices(graph, face))
                {
                    if (OnBoundary(graph, v))
                    {
                        return Fail(Core::ErrorCode::DegenerateTopology, "hole would touch a boundary vertex",
                                    {face, v});
                    }
                }
            }
            else
            {
                for (CellId e : edges)
                {
                    if (graph.Coboundary(e).size() < 2)
                        return Fail(Core::ErrorCode::CellInUse, "edge would be left without faces", {face, e});
                }
            }

            for (CellId e : edges)
                if (auto s = tx.Unlink(face, e); !s) return std::unexpected(std::move(s.error()));
            if (auto s = tx.RemoveCell(face); !s) return std::unexpected(std::move(s.error()));
            return edges;
        }

        [[nodiscard]] Status UnlinkAndRemove(Transaction& tx, CellId cell)
        {
            const auto boundary = tx.Graph().Boundary(cell);
            const std::vector<Incidence> children(boundary.begin(), boundary.end());
            for (const Incidence& c : children)
                if (auto s = tx.Unlink(cell, c.Cell); !s) return std::unexpected(std::move(s.error()));
            return tx.RemoveCell(cell);
        }
    }

    // =========================================================================
    // Holes
    // =========================================================================

    Result<std::vector<CellId>> CreateHole(Complex& complex, CellId face)
    {
        Transaction tx(complex, "CreateHole");
        if (auto s = Require(tx.Graph(), face, Dimension::Face); !s) return std::unexpected(std::move(s.error()));
        if (auto s = RequireKind(complex, ComplexKind::Surface, "CreateHole"); !s)
            return std::unexpected(std::move(s.error()));

        auto edges = RemoveFace(tx, face);
        if (!edges) return edges;
        for (CellId e : *edges) tx.Touch(e);

        tx.Expect(-1, 0, +1);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return edges;
    }

    Status DeleteFace(Complex& complex, CellId face)
    {
        Transaction tx(complex, "DeleteFace");
        if (auto s = Require(tx.Graph(), face, Dimension::Face); !s) return s;

        auto edges = RemoveFace(tx, face);
        if (!edges) return std::unexpected(std::move(edges.error()));
        for (CellId e : *edges) tx.Touch(e);

        tx.Expect(-1, 0, +1);
        return tx.Commit();
    }

    Result<CellId> CloseHole(Complex& complex, std::span<const CellId> edges)
    {
        Transaction tx(complex, "CloseHole");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = RequireKind(complex, ComplexKind::Surface, "CloseHole"); !s)
            return std::unexpected(std::move(s.error()));

        if (edges.size() < 3)
            return Fail(Core::ErrorCode::DegenerateTopology, "a hole needs at least three edges");

        std::unordered_map<CellId, Incidence> holeSteps;
        for (CellId e : edges)
        {
            if (auto s = Require(graph, e, Dimension::Edge); !s) return std::unexpected(std::move(s.error()));
            if (graph.Coboundary(e).size() != 1)
                return Fail(Core::ErrorCode::DegenerateTopology, "edge is not on a boundary loop", {e});
            if (!holeSteps.emplace(e, Incidence{e, Flip(graph.Coboundary(e)[0].Sign)}).second)
                return Fail(Core::ErrorCode::DegenerateTopology, "edge listed twice", {e});
        }

        // Chain the loop from the first edge.
        std::vector<Incidence> loop{holeSteps.at(edges[0])};
        std::unordered_set<CellId> visited{Orbits::StepStart(graph, loop.front())};
        while (loop.size() < edges.size())
        {
            const CellId at = Orbits::StepEnd(graph, loop.back());
            if (!visited.insert(at).second)
                return Fail(Core::ErrorCode::DegenerateTopology, "edges do not form a single loop", {at});

            std::optional<Incidence> next;
            for (const Incidence& inc : graph.Coboundary(at))
            {
                auto it = holeSteps.find(inc.Cell);
                if (it == holeSteps.end() || inc.Cell == loop.back().Cell) continue;
                if (Orbits::StepStart(graph, it->second) != at) continue;
                if (next) return Fail(Core::ErrorCode::DegenerateTopology, "boundary loop is pinched", {at});
                next = it->second;
            }
            if (!next) return Fail(Core::ErrorCode::DegenerateTopology, "boundary loop is open", {at});
            loop.push_back(*next);
        }
        if (Orbits::StepEnd(graph, loop.back()) != Orbits::StepStart(graph, loop.front()))
        {
            return Fail(Core::ErrorCode::DegenerateTopology, "edges do not close into one loop",
                        {loop.front().Cell, loop.back().Cell});
        }

        const CellId face = tx.AddCell(Dimension::Face);
        for (const Incidence& step : loop)
            if (auto s = tx.Link(face, step.Cell, step.Sign); !s) return std::unexpected(std::move(s.error()));

        tx.Expect(+1, 0, -1);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return face;
    }

    // =========================================================================
    // CreateHandle
    // =========================================================================

    Result<HandleResult> CreateHandle(Complex& complex, CellId f1, CellId f2, std::optional<CellId> v1,
                                      std::optional<CellId> v2)
    {
        Transaction tx(complex, "CreateHandle");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = RequireKind(complex, ComplexKind::Surface, "CreateHandle"); !s)
            return std::unexpected(std::move(s.error()));
        if (auto s = Require(graph, f1, Dimension::Face); !s) return std::unexpected(std::move(s.error()));
        if (auto s = Require(graph, f2, Dimension::Face); !s) return std::unexpected(std::move(s.error()));
        if (f1 == f2) return Fail(Core::ErrorCode::DegenerateTopology, "a handle needs two faces", {f1});

        const std::vector<Incidence> b1(graph.Boundary(f1).begin(), graph.Boundary(f1).end());
        const std::vector<Incidence> b2(graph.Boundary(f2).begin(), graph.Boundary(f2).end());
        if (b1.size() != b2.size())
        {
            return Fail(Core::ErrorCode::IncompatibleBoundary,
                        std::format("boundary lengths differ ({} and {})", b1.size(), b2.size()), {f1, f2});
        }

        const auto corners1 = Orbits::FaceVertices(graph, f1);
        const std::unordered_set<CellId> onF1(corners1.begin(), corners1.end());
        for (CellId v : Orbits::FaceVertices(graph, f2))
        {
            if (onF1.contains(v))
                return Fail(Core::ErrorCode::DegenerateTopology, "faces share a vertex", {f1, f2, v});
        }

        std::size_t s1 = Orbits::CanonicalStart(graph, f1);
        std::size_t s2 = Orbits::CanonicalStart(graph, f2);
        if (v1)
        {
            auto step = Orbits::FindStepFrom(graph, f1, *v1);
            if (!step) return Fail(Core::ErrorCode::IncompatibleBoundary, "alignment vertex not on face", {f1, *v1});
            s1 = *step;
        }
        if (v2)
        {
            auto step = Orbits::FindStepFrom(graph, f2, *v2);
            if (!step) return Fail(Core::ErrorCode::IncompatibleBoundary, "alignment vertex not on face", {f2, *v2});
            s2 = *step;
        }

        // f1 is walked forward and f2 backward so the tube is orientable.
        // Corner i of f1 is joined to corner i of f2.
        const std::size_t k = b1.size();
        auto cornerA = [&](std::size_t start, std::size_t i) { return Orbits::StepStart(graph, b1[(start + i) % k]); };
        auto cornerB = [&](std::size_t start, std::size_t i) {
            return Orbits::StepStart(graph, b2[(start + k - i) % k]);
        };
        auto reusesEdge = [&](std::size_t t1, std::size_t t2) {
            for (std::size_t i = 0; i < k; ++i)
                if (Orbits::FindEdge(graph, cornerA(t1, i), cornerB(t2, i))) return true;
            return false;
        };

        // Without full alignment, turn the free face until no tube edge
        // would duplicate an existing one.
        const bool turnF1 = v2 && !v1;
        const std::size_t turns = (v1 && v2) ? 1 : k;
        bool aligned = false;
        for (std::size_t r = 0; r < turns && !aligned; ++r)
        {
            const std::size_t t1 = turnF1 ? (s1 + r) % k : s1;
            const std::size_t t2 = turnF1 ? s2 : (s2 + r) % k;
            if (reusesEdge(t1, t2)) continue;
            s1 = t1;
            s2 = t2;
            aligned = true;
        }
        if (!aligned)
        {
            return Fail(Core::ErrorCode::DegenerateTopology,
                        turns == 1 ? "tube edge already exists" : "every pairing of the faces reuses an existing edge",
                        {f1, f2});
        }

        std::vector<CellId> a(k);
        std::vector<CellId> b(k);
        std::vector<Incidence> stepA(k);
        std::vector<Incidence> stepB(k);
        for (std::size_t i = 0; i < k; ++i)
        {
            stepA[i] = b1[(s1 + i) % k];
            a[i] = cornerA(s1, i);
            b[i] = cornerB(s2, i);
            stepB[i] = b2[(s2 + 2 * k - i - 1) % k];
        }

        const bool joined = !tx.SameComponent(a[0], b[0]);

        for (CellId f : {f1, f2})
            if (auto s = UnlinkAndRemove(tx, f); !s) return std::unexpected(std::move(s.error()));

        HandleResult result;
        result.JoinedComponents = joined;
        for (std::size_t i = 0; i < k; ++i)
        {
            const CellId c = tx.AddCell(Dimension::Edge);
            if (auto s = tx.Link(c, a[i], Orientation::Negative); !s) return std::unexpected(std::move(s.error()));
            if (auto s = tx.Link(c, b[i], Orientation::Positive); !s) return std::unexpected(std::move(s.error()));
            result.Edges.push_back(c);
        }

        for (std::size_t i = 0; i < k; ++i)
        {
            const CellId quad = tx.AddCell(Dimension::Face);
            const Incidence steps[] = {
                stepA[i],
                Incidence{result.Edges[(i + 1) % k], Orientation::Positive},
                stepB[i],
                Incidence{result.Edges[i], Orientation::Negative},
            };
            for (const Incidence& step : steps)
                if (auto s = tx.Link(quad, step.Cell, step.Sign); !s) return std::unexpected(std::move(s.error()));
            result.Faces.push_back(quad);
        }

        tx.Expect(-2, joined ? -1 : 0);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));

        Core::Log::Info("CreateHandle: {} tube faces, {}", k, joined ? "components joined" : "genus raised");
        return result;
    }

    // =========================================================================
    // MakePolygon
    // =========================================================================

    Result<PolygonResult> MakePolygon(Complex& complex, std::size_t corners, PolygonShell shell)
    {
        Transaction tx(complex, "MakePolygon");
        if (auto s = RequireKind(complex, ComplexKind::Surface, "MakePolygon"); !s)
            return std::unexpected(std::move(s.error()));
        if (corners < 3)
            return Fail(Core::ErrorCode::DegenerateTopology, std::format("a polygon needs 3 corners, got {}", corners));

        PolygonResult result;
        for (std::size_t i = 0; i < corners; ++i) result.Vertices.push_back(tx.AddCell(Dimension::Vertex));
        for (std::size_t i = 0; i < corners; ++i)
        {
            const CellId e = tx.AddCell(Dimension::Edge);
            if (auto s = tx.Link(e, result.Vertices[i], Orientation::Negative); !s)
                return std::unexpected(std::move(s.error()));
            if (auto s = tx.Link(e, result.Vertices[(i + 1) % corners], Orientation::Positive); !s)
                return std::unexpected(std::move(s.error()));
            result.Edges.push_back(e);
        }

        const CellId front = tx.AddCell(Dimension::Face);
        for (CellId e : result.Edges)
            if (auto s = tx.Link(front, e, Orientation::Positive); !s) return std::unexpected(std::move(s.error()));
        result.Faces.push_back(front);

        if (shell == PolygonShell::Sphere)
        {
            const CellId back = tx.AddCell(Dimension::Face);
            for (auto it = result.Edges.rbegin(); it != result.Edges.rend(); ++it)
                if (auto s = tx.Link(back, *it, Orientation::Negative); !s)
                    return std::unexpected(std::move(s.error()));
            result.Faces.push_back(back);
        }

        const bool disk = shell == PolygonShell::Disk;
        tx.Expect(disk ? 1 : 2, +1, disk ? 1 : 0);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return result;
    }

    // =========================================================================
    // Volumes
    // =========================================================================

    Result<CellId> AttachVolume(Complex& complex, std::span<const CellId> faces)
    {
        Transaction tx(complex, "AttachVolume");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = RequireKind(complex, ComplexKind::Volumetric, "AttachVolume"); !s)
            return std::unexpected(std::move(s.error()));
        if (faces.empty()) return Fail(Core::ErrorCode::DegenerateTopology, "a volume needs faces");

        std::unordered_set<CellId> seen;
        for (CellId f : faces)
        {
            if (auto s = Require(graph, f, Dimension::Face); !s) return std::unexpected(std::move(s.error()));
            if (!seen.insert(f).second) return Fail(Core::ErrorCode::DegenerateTopology, "face listed twice", {f});
            if (graph.Coboundary(f).size() >= 2)
                return Fail(Core::ErrorCode::DegenerateTopology, "face already bounds two volumes", {f});
        }

        struct Use
        {
            std::size_t Face;
            Orientation Sign;
        };
        std::unordered_map<CellId, std::vector<Use>> uses;
        for (std::size_t i = 0; i < faces.size(); ++i)
            for (const Incidence& e : graph.Boundary(faces[i])) uses[e.Cell].push_back(Use{i, e.Sign});

        for (const auto& [edge, list] : uses)
        {
            if (list.size() != 2)
            {
                return Fail(Core::ErrorCode::DegenerateTopology,
                            std::format("shell is not closed: edge used {} times", list.size()), {edge});
            }
        }

        // Neighbouring faces must induce opposite orientations on their
        // shared edge: s_j * o_j = -s_i * o_i.
        std::vector<std::optional<Orientation>> signs(faces.size());
        std::deque<std::size_t> queue{0};
        signs[0] = Orientation::Positive;
        while (!queue.empty())
        {
            const std::size_t i = queue.front();
            queue.pop_front();
            for (const Incidence& e : graph.Boundary(faces[i]))
            {
                const auto& list = uses.at(e.Cell);
                const Use& other = list[0].Face == i ? list[1] : list[0];
                const Orientation wanted = FromSign(-Sign(*signs[i]) * Sign(e.Sign) * Sign(other.Sign));
                if (!signs[other.Face])
                {
                    signs[other.Face] = wanted;
                    queue.push_back(other.Face);
                }
                else if (*signs[other.Face] != wanted)
                {
                    return Fail(Core::ErrorCode::DegenerateTopology, "shell is not orientable", {faces[other.Face]});
                }
            }
        }
        for (std::size_t i = 0; i < faces.size(); ++i)
        {
            if (!signs[i])
                return Fail(Core::ErrorCode::DegenerateTopology, "faces form more than one shell", {faces[i]});
        }

        // A face shared with an existing volume must be used the other way.
        std::optional<bool> flip;
        for (std::size_t i = 0; i < faces.size(); ++i)
        {
            const auto existing = graph.Coboundary(faces[i]);
            if (existing.empty()) continue;
            const bool needsFlip = existing[0].Sign == *signs[i];
            if (flip && *flip != needsFlip)
            {
                return Fail(Core::ErrorCode::DegenerateTopology, "shell orientation conflicts with its neighbours",
                            {faces[i]});
            }
            flip = needsFlip;
        }

        const CellId volume = tx.AddCell(Dimension::Volume);
        for (std::size_t i = 0; i < faces.size(); ++i)
        {
            const Orientation sign = flip.value_or(false) ? Flip(*signs[i]) : *signs[i];
            if (auto s = tx.Link(volume, faces[i], sign); !s) return std::unexpected(std::move(s.error()));
        }

        tx.Expect(-1);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));
        return volume;
    }

    Status DeleteVolume(Complex& complex, CellId volume)
    {
        Transaction tx(complex, "DeleteVolume");
        if (auto s = Require(tx.Graph(), volume, Dimension::Volume); !s) return s;
        if (auto s = UnlinkAndRemove(tx, volume); !s) return s;

        tx.Expect(+1);
        return tx.Commit();
    }
}
