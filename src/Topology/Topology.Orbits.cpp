module;

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <unordered_set>
#include <utility>
#include <vector>

module Topology:Orbits.Impl;

import Core;
import :Orbits;

namespace Topology::Orbits
{
    namespace
    {
        struct Corner
        {
            CellId Face;
            std::size_t Step; // step of Face that leaves the vertex
        };

        [[nodiscard]] CellId OtherFace(const IncidenceGraph& graph, CellId edge, CellId face) noexcept
        {
            for (const Incidence& inc : graph.Coboundary(edge))
                if (inc.Cell != face) return inc.Cell;
            return {};
        }

        // Rotate across the edge leaving the vertex.
        [[nodiscard]] std::optional<Corner> NextCorner(const IncidenceGraph& graph, CellId vertex, Corner c)
        {
            const CellId out = graph.Boundary(c.Face)[c.Step].Cell;
            const CellId next = OtherFace(graph, out, c.Face);
            if (!next.IsValid()) return std::nullopt;
            auto step = FindStepFrom(graph, next, vertex);
            if (!step) return std::nullopt;
            return Corner{next, *step};
        }

        // Rotate across the edge arriving at the vertex.
        [[nodiscard]] std::optional<Corner> PrevCorner(const IncidenceGraph& graph, CellId vertex, Corner c)
        {
            const auto boundary = graph.Boundary(c.Face);
            const CellId in = boundary[(c.Step + boundary.size() - 1) % boundary.size()].Cell;
            const CellId prev = OtherFace(graph, in, c.Face);
            if (!prev.IsValid()) return std::nullopt;
            auto step = FindStepFrom(graph, prev, vertex);
            if (!step) return std::nullopt;
            return Corner{prev, *step};
        }

        [[nodiscard]] std::size_t WalkLimit(const IncidenceGraph& graph, CellId vertex) noexcept
        {
            std::size_t limit = 1;
            for (const Incidence& e : graph.Coboundary(vertex)) limit += graph.Coboundary(e.Cell).size();
            return limit;
        }

        // First corner of the radial walk: the start of the fan for a boundary
        // vertex, any face for an interior one.
        [[nodiscard]] std::optional<Corner> FanStart(const IncidenceGraph& graph, CellId vertex)
        {
            std::optional<Corner> first;
            for (const Incidence& e : graph.Coboundary(vertex))
            {
                for (const Incidence& f : graph.Coboundary(e.Cell))
                {
                    if (auto step = FindStepFrom(graph, f.Cell, vertex))
                    {
                        first = Corner{f.Cell, *step};
                        break;
                    }
                }
                if (first) break;
            }
            if (!first) return std::nullopt;

            const std::size_t limit = WalkLimit(graph, vertex);
            Corner start = *first;
            for (std::size_t n = 0; n < limit; ++n)
            {
                auto prev = PrevCorner(graph, vertex, start);
                if (!prev) break;
                if (prev->Face == first->Face) return first;
                start = *prev;
            }
            return start;
        }

        void SortByDimension(const IncidenceGraph& graph, std::vector<CellId>& cells)
        {
            std::sort(cells.begin(), cells.end(), [&](CellId a, CellId b) {
                const auto da = Rank(graph.DimensionOf(a));
                const auto db = Rank(graph.DimensionOf(b));
                if (da != db) return da < db;
                return a < b;
            });
        }

        // Transitive closure along boundary (down) or co-boundary (up) links.
        [[nodiscard]] std::unordered_set<CellId> Sweep(const IncidenceGraph& graph, std::span<const CellId> seeds,
                                                       bool upward)
        {
            std::unordered_set<CellId> seen(seeds.begin(), seeds.end());
            std::vector<CellId> stack(seeds.begin(), seeds.end());
            while (!stack.empty())
            {
                const CellId cell = stack.back();
                stack.pop_back();
                const auto next = upward ? graph.Coboundary(cell) : graph.Boundary(cell);
                for (const Incidence& inc : next)
                    if (seen.insert(inc.Cell).second) stack.push_back(inc.Cell);
            }
            return seen;
        }

        [[nodiscard]] Result<Dimension> Expect(const Complex& complex, CellId id, Dimension wanted)
        {
            auto dim = complex.DimensionOf(id);
            if (!dim) return dim;
            if (*dim != wanted)
            {
                return Fail(Core::ErrorCode::InvalidArgument,
                            std::format("expected a {}, got a {}", DimensionToString(wanted), DimensionToString(*dim)),
                            {id});
            }
            return dim;
        }
    }

    // =========================================================================
    // Graph-level helpers
    // =========================================================================

    CellId Tail(const IncidenceGraph& graph, CellId edge) noexcept
    {
        const auto b = graph.Boundary(edge);
        assert(b.size() == 2);
        return b[0].Sign == Orientation::Negative ? b[0].Cell : b[1].Cell;
    }

    CellId Head(const IncidenceGraph& graph, CellId edge) noexcept
    {
        const auto b = graph.Boundary(edge);
        assert(b.size() == 2);
        return b[0].Sign == Orientation::Positive ? b[0].Cell : b[1].Cell;
    }

    CellId Opposite(const IncidenceGraph& graph, CellId edge, CellId vertex) noexcept
    {
        const CellId t = Tail(graph, edge);
        return t == vertex ? Head(graph, edge) : t;
    }

    CellId StepStart(const IncidenceGraph& graph, Incidence step) noexcept
    {
        return step.Sign == Orientation::Positive ? Tail(graph, step.Cell) : Head(graph, step.Cell);
    }

    CellId StepEnd(const IncidenceGraph& graph, Incidence step) noexcept
    {
        return step.Sign == Orientation::Positive ? Head(graph, step.Cell) : Tail(graph, step.Cell);
    }

    std::optional<CellId> FindEdge(const IncidenceGraph& graph, CellId a, CellId b) noexcept
    {
        for (const Incidence& inc : graph.Coboundary(a))
        {
            if (Opposite(graph, inc.Cell, a) == b) return inc.Cell;
        }
        return std::nullopt;
    }

    std::optional<std::size_t> FindStepFrom(const IncidenceGraph& graph, CellId face, CellId vertex) noexcept
    {
        const auto boundary = graph.Boundary(face);
        for (std::size_t i = 0; i < boundary.size(); ++i)
            if (StepStart(graph, boundary[i]) == vertex) return i;
        return std::nullopt;
    }

    std::optional<std::size_t> FindStep(const IncidenceGraph& graph, CellId face, CellId edge) noexcept
    {
        const auto boundary = graph.Boundary(face);
        for (std::size_t i = 0; i < boundary.size(); ++i)
            if (boundary[i].Cell == edge) return i;
        return std::nullopt;
    }

    std::size_t CanonicalStart(const IncidenceGraph& graph, CellId face) noexcept
    {
        const auto boundary = graph.Boundary(face);
        std::size_t best = 0;
        CellId bestVertex{};
        for (std::size_t i = 0; i < boundary.size(); ++i)
        {
            const CellId v = StepStart(graph, boundary[i]);
            if (i == 0 || v < bestVertex)
            {
                best = i;
                bestVertex = v;
            }
        }
        return best;
    }

    std::vector<CellId> FaceVertices(const IncidenceGraph& graph, CellId face)
    {
        const auto boundary = graph.Boundary(face);
        const std::size_t start = CanonicalStart(graph, face);
        std::vector<CellId> out;
        out.reserve(boundary.size());
        for (std::size_t i = 0; i < boundary.size(); ++i)
            out.push_back(StepStart(graph, boundary[(start + i) % boundary.size()]));
        return out;
    }

    std::vector<CellId> VertexEdges(const IncidenceGraph& graph, CellId vertex)
    {
        std::vector<CellId> out;
        for (const Incidence& inc : graph.Coboundary(vertex)) out.push_back(inc.Cell);
        return out;
    }

    std::vector<CellId> RadialFan(const IncidenceGraph& graph, CellId vertex)
    {
        std::vector<CellId> fan;
        const auto start = FanStart(graph, vertex);
        if (!start) return fan;

        const std::size_t limit = WalkLimit(graph, vertex);
        Corner c = *start;
        for (std::size_t n = 0; n < limit; ++n)
        {
            fan.push_back(c.Face);
            auto next = NextCorner(graph, vertex, c);
            if (!next || next->Face == start->Face) break;
            c = *next;
        }
        return fan;
    }

    std::vector<std::vector<Incidence>> BoundaryLoops(const IncidenceGraph& graph)
    {
        const CellRegistry& registry = graph.Registry();
        std::vector<bool> visited(registry.Capacity(), false);
        std::vector<std::vector<Incidence>> loops;

        // A hole traverses each boundary edge against its single face.
        auto holeStep = [&](CellId edge) {
            return Incidence{edge, Flip(graph.Coboundary(edge)[0].Sign)};
        };

        registry.ForEach(Dimension::Edge, [&](CellId seed) {
            if (visited[seed.Index] || graph.Coboundary(seed).size() != 1) return;

            std::vector<Incidence> loop;
            Incidence step = holeStep(seed);
            while (!visited[step.Cell.Index])
            {
                visited[step.Cell.Index] = true;
                loop.push_back(step);

                const CellId at = StepEnd(graph, step);
                std::optional<Incidence> next;
                for (const Incidence& inc : graph.Coboundary(at))
                {
                    if (inc.Cell == step.Cell || graph.Coboundary(inc.Cell).size() != 1) continue;
                    const Incidence candidate = holeStep(inc.Cell);
                    if (StepStart(graph, candidate) == at && !visited[inc.Cell.Index])
                    {
                        next = candidate;
                        break;
                    }
                }
                if (!next) break;
                step = *next;
            }
            loops.push_back(std::move(loop));
        });

        return loops;
    }

    std::size_t CountBoundaryLoops(const IncidenceGraph& graph)
    {
        return BoundaryLoops(graph).size();
    }

    std::size_t CountComponents(const IncidenceGraph& graph)
    {
        const CellRegistry& registry = graph.Registry();
        std::vector<bool> visited(registry.Capacity(), false);
        std::size_t components = 0;

        registry.ForEach(Dimension::Vertex, [&](CellId seed) {
            if (visited[seed.Index]) return;
            ++components;

            std::vector<CellId> stack{seed};
            visited[seed.Index] = true;
            while (!stack.empty())
            {
                const CellId v = stack.back();
                stack.pop_back();
                for (const Incidence& inc : graph.Coboundary(v))
                {
                    const CellId w = Opposite(graph, inc.Cell, v);
                    if (!visited[w.Index])
                    {
                        visited[w.Index] = true;
                        stack.push_back(w);
                    }
                }
            }
        });

        return components;
    }

    // =========================================================================
    // FaceBoundaryRange
    // =========================================================================

    FaceBoundaryRange::FaceBoundaryRange(const Complex& complex, CellId face)
        : m_Complex(&complex),
          m_Face(face),
          m_Epoch(complex.Epoch()),
          m_Start(CanonicalStart(complex.Graph(), face)),
          m_Size(complex.Graph().Boundary(face).size())
    {
    }

    BoundaryStep FaceBoundaryRange::Iterator::operator*() const
    {
        assert(m_Range->m_Complex->Epoch() == m_Range->m_Epoch && "complex edited during traversal");
        const IncidenceGraph& graph = m_Range->m_Complex->Graph();
        const auto boundary = graph.Boundary(m_Range->m_Face);
        const Incidence step = boundary[(m_Range->m_Start + m_Visited) % m_Range->m_Size];
        return BoundaryStep{StepStart(graph, step), step.Cell, step.Sign};
    }

    FaceBoundaryRange::Iterator& FaceBoundaryRange::Iterator::operator++()
    {
        ++m_Visited;
        return *this;
    }

    // =========================================================================
    // VertexStarRange
    // =========================================================================

    VertexStarRange::VertexStarRange(const Complex& complex, CellId vertex)
        : m_Complex(&complex), m_Vertex(vertex), m_Epoch(complex.Epoch()), m_Limit(WalkLimit(complex.Graph(), vertex))
    {
        const IncidenceGraph& graph = complex.Graph();

        if (complex.Kind() == ComplexKind::Volumetric)
        {
            for (const Incidence& e : graph.Coboundary(vertex))
                for (const Incidence& f : graph.Coboundary(e.Cell))
                    m_Sorted.push_back(f.Cell);
            std::sort(m_Sorted.begin(), m_Sorted.end());
            m_Sorted.erase(std::unique(m_Sorted.begin(), m_Sorted.end()), m_Sorted.end());
        }
    }

    VertexStarRange::Iterator VertexStarRange::begin() const
    {
        CheckEpoch();

        Iterator it;
        it.m_Range = this;

        if (m_Complex->Kind() == ComplexKind::Volumetric)
        {
            if (!m_Sorted.empty()) it.m_Face = m_Sorted.front();
            it.m_First = it.m_Face;
            return it;
        }

        const auto start = FanStart(m_Complex->Graph(), m_Vertex);
        if (!start) return it;

        it.m_First = start->Face;
        it.m_Face = start->Face;
        it.m_Step = start->Step;
        return it;
    }

    CellId VertexStarRange::Iterator::operator*() const
    {
        m_Range->CheckEpoch();
        return m_Face;
    }

    VertexStarRange::Iterator& VertexStarRange::Iterator::operator++()
    {
        m_Range->CheckEpoch();
        ++m_Visited;

        if (m_Range->m_Complex->Kind() == ComplexKind::Volumetric)
        {
            ++m_Step;
            m_Face = m_Step < m_Range->m_Sorted.size() ? m_Range->m_Sorted[m_Step] : CellId{};
            return *this;
        }

        auto next = NextCorner(m_Range->m_Complex->Graph(), m_Range->m_Vertex, Corner{m_Face, m_Step});
        if (!next || next->Face == m_First || m_Visited >= m_Range->m_Limit)
        {
            m_Face = {};
            return *this;
        }
        m_Face = next->Face;
        m_Step = next->Step;
        return *this;
    }

    // =========================================================================
    // Checked entry points
    // =========================================================================

    Result<FaceBoundaryRange> FaceBoundary(const Complex& complex, CellId face)
    {
        if (auto dim = Expect(complex, face, Dimension::Face); !dim) return std::unexpected(std::move(dim.error()));
        return FaceBoundaryRange(complex, face);
    }

    Result<VertexStarRange> VertexStar(const Complex& complex, CellId vertex)
    {
        if (auto dim = Expect(complex, vertex, Dimension::Vertex); !dim)
            return std::unexpected(std::move(dim.error()));
        return VertexStarRange(complex, vertex);
    }

    Result<CellRange> EdgeRing(const Complex& complex, CellId edge)
    {
        if (auto dim = Expect(complex, edge, Dimension::Edge); !dim) return std::unexpected(std::move(dim.error()));

        const IncidenceGraph& graph = complex.Graph();
        const auto faces = graph.Coboundary(edge);
        std::vector<CellId> out;
        out.reserve(faces.size());

        if (complex.Kind() == ComplexKind::Surface)
        {
            for (const Incidence& f : faces)
                if (f.Sign == Orientation::Positive) out.push_back(f.Cell);
            for (const Incidence& f : faces)
                if (f.Sign == Orientation::Negative) out.push_back(f.Cell);
            return CellRange(std::move(out));
        }

        // Faces around the edge are chained by the volumes they bound: each
        // volume on the edge holds exactly two of them. Start at a chain end
        // (a face with fewer than two volumes) when there is one.
        std::vector<CellId> pending;
        for (const Incidence& f : faces) pending.push_back(f.Cell);
        std::sort(pending.begin(), pending.end());

        auto faceInVolumeOnEdge = [&](CellId volume, CellId except) -> CellId {
            for (const Incidence& g : graph.Boundary(volume))
            {
                if (g.Cell == except) continue;
                if (FindStep(graph, g.Cell, edge)) return g.Cell;
            }
            return {};
        };

        std::unordered_set<CellId> placed;
        auto walkFrom = [&](CellId face) {
            CellId current = face;
            CellId cameThrough{};
            while (current.IsValid() && placed.insert(current).second)
            {
                out.push_back(current);
                CellId nextVolume{};
                for (const Incidence& c : graph.Coboundary(current))
                {
                    if (c.Cell != cameThrough)
                    {
                        nextVolume = c.Cell;
                        break;
                    }
                }
                if (!nextVolume.IsValid()) break;
                cameThrough = nextVolume;
                current = faceInVolumeOnEdge(nextVolume, current);
            }
        };

        for (CellId f : pending)
            if (!placed.contains(f) && graph.Coboundary(f).size() < 2 && !graph.Coboundary(f).empty()) walkFrom(f);
        for (CellId f : pending)
            if (!placed.contains(f) && graph.Coboundary(f).size() == 2) walkFrom(f);
        for (CellId f : pending)
            if (!placed.contains(f)) out.push_back(f);

        return CellRange(std::move(out));
    }

    Result<CellRange> Star(const Complex& complex, CellId cell)
    {
        if (auto dim = complex.DimensionOf(cell); !dim) return std::unexpected(std::move(dim.error()));

        const CellId seed[] = {cell};
        auto set = Sweep(complex.Graph(), seed, true);
        std::vector<CellId> out(set.begin(), set.end());
        SortByDimension(complex.Graph(), out);
        return CellRange(std::move(out));
    }

    Result<CellRange> Closure(const Complex& complex, CellId cell)
    {
        if (auto dim = complex.DimensionOf(cell); !dim) return std::unexpected(std::move(dim.error()));

        const CellId seed[] = {cell};
        auto set = Sweep(complex.Graph(), seed, false);
        std::vector<CellId> out(set.begin(), set.end());
        SortByDimension(complex.Graph(), out);
        return CellRange(std::move(out));
    }

    Result<CellRange> Link(const Complex& complex, CellId cell)
    {
        if (auto dim = complex.DimensionOf(cell); !dim) return std::unexpected(std::move(dim.error()));

        const IncidenceGraph& graph = complex.Graph();
        const CellId seed[] = {cell};

        const auto star = Sweep(graph, seed, true);
        const std::vector<CellId> starCells(star.begin(), star.end());
        const auto closureOfStar = Sweep(graph, starCells, false);

        const auto closure = Sweep(graph, seed, false);
        const std::vector<CellId> closureCells(closure.begin(), closure.end());
        const auto starOfClosure = Sweep(graph, closureCells, true);

        std::vector<CellId> out;
        for (CellId c : closureOfStar)
            if (!starOfClosure.contains(c)) out.push_back(c);
        SortByDimension(graph, out);
        return CellRange(std::move(out));
    }
}
