module;

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <format>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

module Topology:Complex.Impl;

import Core;
import :Complex;
import :Orbits;
import :Validation;
import :Euler;

namespace Topology
{
    Complex::Complex() = default;

    Complex::Complex(ComplexOptions options) : m_Options(options)
    {
    }

    Complex::Complex(const Complex& other)
    {
        auto lock = other.ReadLock();
        m_Options = other.m_Options;
        m_Graph = other.m_Graph;
        m_Tracked = other.m_Tracked;
        m_Components = other.m_Components;
        m_Epoch = other.m_Epoch;
    }

    Complex::Complex(Complex&& other) noexcept
        : m_Options(other.m_Options),
          m_Graph(std::move(other.m_Graph)),
          m_Tracked(other.m_Tracked),
          m_Components(std::move(other.m_Components)),
          m_Epoch(other.m_Epoch)
    {
    }

    Complex& Complex::operator=(const Complex& other)
    {
        if (this == &other) return *this;

        std::unique_lock<std::shared_mutex> mine(m_Mutex, std::defer_lock);
        std::shared_lock<std::shared_mutex> theirs(other.m_Mutex, std::defer_lock);
        std::lock(mine, theirs);

        m_Options = other.m_Options;
        m_Graph = other.m_Graph;
        m_Tracked = other.m_Tracked;
        m_Components = other.m_Components;
        ++m_Epoch;
        return *this;
    }

    Complex& Complex::operator=(Complex&& other) noexcept
    {
        if (this == &other) return *this;
        m_Options = other.m_Options;
        m_Graph = std::move(other.m_Graph);
        m_Tracked = other.m_Tracked;
        m_Components = std::move(other.m_Components);
        m_Epoch = other.m_Epoch + 1;
        return *this;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    Result<std::span<const Incidence>> Complex::BoundaryOf(CellId id) const
    {
        auto view = m_Graph.Get(id);
        if (!view) return std::unexpected(std::move(view.error()));
        return view->Boundary;
    }

    Result<std::span<const Incidence>> Complex::CoboundaryOf(CellId id) const
    {
        auto view = m_Graph.Get(id);
        if (!view) return std::unexpected(std::move(view.error()));
        return view->Coboundary;
    }

    std::int64_t Complex::CountedEulerCharacteristic() const noexcept
    {
        const CellRegistry& registry = m_Graph.Registry();
        std::int64_t chi = 0;
        for (std::size_t d = 0; d < kDimensionCount; ++d)
        {
            const auto n = static_cast<std::int64_t>(registry.Count(static_cast<Dimension>(d)));
            chi += (d % 2 == 0) ? n : -n;
        }
        return chi;
    }

    ComplexStats Complex::Stats() const
    {
        ComplexStats stats;
        for (std::size_t d = 0; d < kDimensionCount; ++d)
            stats.Counts[d] = m_Graph.Registry().Count(static_cast<Dimension>(d));
        stats.Tracked = m_Tracked;
        stats.Epoch = m_Epoch;
        return stats;
    }

    void Complex::Retrack()
    {
        m_Tracked.EulerCharacteristic = CountedEulerCharacteristic();
        m_Tracked.Components = static_cast<std::int64_t>(Orbits::CountComponents(m_Graph));
        m_Tracked.BoundaryLoops =
            Kind() == ComplexKind::Surface ? static_cast<std::int64_t>(Orbits::CountBoundaryLoops(m_Graph)) : 0;
        m_Components.Rebuild(m_Graph);
    }

    // =========================================================================
    // ComponentLabels
    // =========================================================================

    void ComponentLabels::Rebuild(const IncidenceGraph& graph)
    {
        const CellRegistry& registry = graph.Registry();
        m_VertexLabel.assign(registry.Capacity(), kNone);
        m_Parent.clear();
        m_Size.clear();

        registry.ForEach(Dimension::Vertex, [&](CellId seed) {
            if (m_VertexLabel[seed.Index] != kNone) return;
            const std::uint32_t label = Fresh();

            std::vector<CellId> stack{seed};
            m_VertexLabel[seed.Index] = label;
            while (!stack.empty())
            {
                const CellId v = stack.back();
                stack.pop_back();
                for (const Incidence& inc : graph.Coboundary(v))
                {
                    for (const Incidence& end : graph.Boundary(inc.Cell))
                    {
                        if (m_VertexLabel[end.Cell.Index] != kNone) continue;
                        m_VertexLabel[end.Cell.Index] = label;
                        stack.push_back(end.Cell);
                    }
                }
            }
        });
    }

    void ComponentLabels::Forget(CellId vertex)
    {
        if (vertex.Index >= m_VertexLabel.size()) m_VertexLabel.resize(vertex.Index + 1, kNone);
        m_VertexLabel[vertex.Index] = kNone;
    }

    std::optional<std::pair<std::uint32_t, std::uint32_t>> ComponentLabels::Connect(CellId tail, CellId head,
                                                                                     std::vector<CellId>& labelled)
    {
        const std::uint32_t a = LabelOf(tail);
        const std::uint32_t b = LabelOf(head);
        if (a == kNone && b == kNone)
        {
            const std::uint32_t label = Fresh();
            Assign(tail, label);
            Assign(head, label);
            labelled.push_back(tail);
            labelled.push_back(head);
            return std::nullopt;
        }
        if (a == kNone)
        {
            Assign(tail, b);
            labelled.push_back(tail);
            return std::nullopt;
        }
        if (b == kNone)
        {
            Assign(head, a);
            labelled.push_back(head);
            return std::nullopt;
        }

        const std::uint32_t ra = Root(a);
        const std::uint32_t rb = Root(b);
        if (ra == rb) return std::nullopt;
        return std::pair{ra, rb};
    }

    void ComponentLabels::Join(std::uint32_t a, std::uint32_t b)
    {
        std::uint32_t ra = Root(a);
        std::uint32_t rb = Root(b);
        if (ra == rb) return;
        if (m_Size[ra] < m_Size[rb]) std::swap(ra, rb);
        m_Parent[rb] = ra;
        m_Size[ra] += m_Size[rb];
    }

    bool ComponentLabels::SameComponent(CellId a, CellId b)
    {
        if (a == b) return true;
        const std::uint32_t la = LabelOf(a);
        const std::uint32_t lb = LabelOf(b);
        if (la == kNone || lb == kNone) return false;
        return Root(la) == Root(lb);
    }

    std::uint32_t ComponentLabels::LabelOf(CellId vertex) const noexcept
    {
        return vertex.Index < m_VertexLabel.size() ? m_VertexLabel[vertex.Index] : kNone;
    }

    void ComponentLabels::Assign(CellId vertex, std::uint32_t label)
    {
        if (vertex.Index >= m_VertexLabel.size()) m_VertexLabel.resize(vertex.Index + 1, kNone);
        m_VertexLabel[vertex.Index] = label;
    }

    std::uint32_t ComponentLabels::Root(std::uint32_t label)
    {
        while (m_Parent[label] != label)
        {
            m_Parent[label] = m_Parent[m_Parent[label]];
            label = m_Parent[label];
        }
        return label;
    }

    std::uint32_t ComponentLabels::Fresh()
    {
        const auto label = static_cast<std::uint32_t>(m_Parent.size());
        m_Parent.push_back(label);
        m_Size.push_back(1);
        return label;
    }

    // =========================================================================
    // Bulk loading
    // =========================================================================

    Status Complex::BuildPolygons(std::size_t vertexCount, std::span<const std::vector<std::uint32_t>> faces,
                                  std::vector<CellId>& vertices, std::vector<CellId>& created)
    {
        vertices.reserve(vertexCount);
        for (std::size_t i = 0; i < vertexCount; ++i) vertices.push_back(m_Graph.AddCell(Dimension::Vertex));

        // Undirected edge key: (min << 32) | max.
        std::unordered_map<std::uint64_t, CellId> edges;
        auto edgeKey = [](std::uint32_t a, std::uint32_t b) {
            const std::uint64_t lo = a < b ? a : b;
            const std::uint64_t hi = a < b ? b : a;
            return (lo << 32) | hi;
        };

        created.reserve(faces.size());
        for (std::size_t fi = 0; fi < faces.size(); ++fi)
        {
            const auto& poly = faces[fi];
            if (poly.size() < 3)
            {
                return Fail(Core::ErrorCode::DegenerateTopology,
                            std::format("face {} has {} corners", fi, poly.size()));
            }
            for (std::size_t j = 0; j < poly.size(); ++j)
            {
                if (poly[j] >= vertexCount)
                {
                    return Fail(Core::ErrorCode::InvalidArgument,
                                std::format("face {} names vertex {} of {}", fi, poly[j], vertexCount));
                }
                for (std::size_t k = j + 1; k < poly.size(); ++k)
                {
                    if (poly[j] == poly[k])
                    {
                        return Fail(Core::ErrorCode::DegenerateTopology,
                                    std::format("face {} visits vertex {} twice", fi, poly[j]));
                    }
                }
            }

            const CellId face = m_Graph.AddCell(Dimension::Face);
            for (std::size_t j = 0; j < poly.size(); ++j)
            {
                const std::uint32_t from = poly[j];
                const std::uint32_t to = poly[(j + 1) % poly.size()];

                auto [it, inserted] = edges.try_emplace(edgeKey(from, to));
                if (inserted)
                {
                    it->second = m_Graph.AddCell(Dimension::Edge);
                    if (auto s = m_Graph.Link(it->second, vertices[from], Orientation::Negative); !s)
                        return std::unexpected(std::move(s.error()));
                    if (auto s = m_Graph.Link(it->second, vertices[to], Orientation::Positive); !s)
                        return std::unexpected(std::move(s.error()));
                }

                const CellId edge = it->second;
                const Orientation sign =
                    Orbits::Tail(m_Graph, edge) == vertices[from] ? Orientation::Positive : Orientation::Negative;
                if (auto s = m_Graph.Link(face, edge, sign); !s) return std::unexpected(std::move(s.error()));
            }
            created.push_back(face);
        }
        return Ok();
    }

    Status Complex::FinishLoad()
    {
        if (auto s = Validation::ToStatus(Validation::ValidateStructure(*this)); !s) return s;
        Retrack();
        return Ok();
    }

    Result<PolygonLoad> Complex::FromPolygons(std::size_t vertexCount,
                                              std::span<const std::vector<std::uint32_t>> faces,
                                              ComplexOptions options)
    {
        PolygonLoad load{Complex(options), {}, {}, {}};
        Complex& complex = load.Loaded;

        auto status = complex.BuildPolygons(vertexCount, faces, load.Vertices, load.Faces);
        if (status) status = complex.FinishLoad();
        if (!status)
        {
            Core::Log::Error("FromPolygons: rejected, {}", Describe(status.error()));
            return std::unexpected(std::move(status.error()));
        }

        Core::Log::Info("FromPolygons: V={} E={} F={} chi={}", complex.Count(Dimension::Vertex),
                        complex.Count(Dimension::Edge), complex.Count(Dimension::Face),
                        complex.EulerCharacteristic());
        return load;
    }

    Result<PolygonLoad> Complex::FromPolyhedra(std::size_t vertexCount,
                                               std::span<const std::vector<std::uint32_t>> faces,
                                               std::span<const std::vector<std::uint32_t>> volumes,
                                               ComplexOptions options)
    {
        options.Kind = ComplexKind::Volumetric;
        PolygonLoad load{Complex(options), {}, {}, {}};
        Complex& complex = load.Loaded;

        auto reject = [](const TopologyError& error) {
            Core::Log::Error("FromPolyhedra: rejected, {}", Describe(error));
            return std::unexpected(error);
        };

        auto status = complex.BuildPolygons(vertexCount, faces, load.Vertices, load.Faces);
        if (status) status = complex.FinishLoad();
        if (!status) return reject(status.error());

        std::unordered_map<std::uint32_t, std::vector<std::size_t>> faceUsers;
        for (std::size_t vi = 0; vi < volumes.size(); ++vi)
        {
            for (std::uint32_t fi : volumes[vi])
            {
                if (fi >= faces.size())
                {
                    return reject(TopologyError{Core::ErrorCode::InvalidArgument, Invariant::None, {},
                                                std::format("volume {} names face {} of {}", vi, fi, faces.size())});
                }
                faceUsers[fi].push_back(vi);
            }
        }

        // Attach in breadth-first order over shared faces so each volume
        // after the first in its group takes its orientation from a neighbour.
        load.Volumes.assign(volumes.size(), CellId{});
        std::vector<bool> queued(volumes.size(), false);
        for (std::size_t seed = 0; seed < volumes.size(); ++seed)
        {
            if (queued[seed]) continue;
            std::deque<std::size_t> queue{seed};
            queued[seed] = true;
            while (!queue.empty())
            {
                const std::size_t vi = queue.front();
                queue.pop_front();

                std::vector<CellId> shell;
                shell.reserve(volumes[vi].size());
                for (std::uint32_t fi : volumes[vi]) shell.push_back(load.Faces[fi]);

                auto volume = Euler::AttachVolume(complex, shell);
                if (!volume) return reject(volume.error());
                load.Volumes[vi] = *volume;

                for (std::uint32_t fi : volumes[vi])
                {
                    for (std::size_t next : faceUsers[fi])
                    {
                        if (!queued[next])
                        {
                            queued[next] = true;
                            queue.push_back(next);
                        }
                    }
                }
            }
        }

        if (auto s = Validation::ToStatus(Validation::Validate(complex)); !s) return reject(s.error());

        Core::Log::Info("FromPolyhedra: V={} E={} F={} C={} chi={}", complex.Count(Dimension::Vertex),
                        complex.Count(Dimension::Edge), complex.Count(Dimension::Face),
                        complex.Count(Dimension::Volume), complex.EulerCharacteristic());
        return load;
    }

    Result<ComplexLoad> Complex::FromCells(const ComplexDump& dump, ComplexOptions options)
    {
        options.Kind = dump.Kind;
        ComplexLoad load{Complex(options), {}};
        Complex& complex = load.Loaded;

        auto reject = [](const TopologyError& error) {
            Core::Log::Error("FromCells: rejected, {}", Describe(error));
            return std::unexpected(error);
        };

        load.CellIds.reserve(dump.Cells.size());
        for (Dimension dim : dump.Cells)
        {
            if (Rank(dim) > Rank(TopDimension(dump.Kind)))
            {
                return reject(TopologyError{Core::ErrorCode::InvalidArgument, Invariant::None, {},
                                            std::format("{} in a complex of top dimension {}",
                                                        DimensionToString(dim),
                                                        DimensionToString(TopDimension(dump.Kind)))});
            }
            load.CellIds.push_back(complex.m_Graph.AddCell(dim));
        }

        for (const ComplexDump::Entry& entry : dump.Incidences)
        {
            if (entry.Parent >= load.CellIds.size() || entry.Child >= load.CellIds.size())
            {
                return reject(TopologyError{Core::ErrorCode::InvalidArgument, Invariant::None, {},
                                            std::format("incidence [{} : {}] outside {} cells", entry.Parent,
                                                        entry.Child, load.CellIds.size())});
            }
            auto linked = complex.m_Graph.Link(load.CellIds[entry.Parent], load.CellIds[entry.Child], entry.Sign);
            if (!linked) return reject(linked.error());
        }

        if (auto s = complex.FinishLoad(); !s) return reject(s.error());
        return load;
    }

    ComplexDump Complex::Dump() const
    {
        const CellRegistry& registry = m_Graph.Registry();
        ComplexDump dump;
        dump.Kind = Kind();

        std::vector<std::uint32_t> position(registry.Capacity(), 0);
        for (std::uint32_t i = 0; i < registry.Capacity(); ++i)
        {
            const CellId id = registry.IdAt(i);
            if (!registry.Contains(id)) continue;
            position[i] = static_cast<std::uint32_t>(dump.Cells.size());
            dump.Cells.push_back(registry.DimensionOf(id));
            dump.SourceIds.push_back(id);
        }

        for (CellId parent : dump.SourceIds)
        {
            for (const Incidence& inc : m_Graph.Boundary(parent))
                dump.Incidences.push_back({position[parent.Index], position[inc.Cell.Index], inc.Sign});
        }
        return dump;
    }
}
