module;

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <unordered_map>
#include <utility>
#include <vector>

module Topology:Algorithms.Duality.Impl;

import Core;
import :Algorithms;
import :Incidence;
import :Orbits;

namespace Topology::Algorithms
{
    namespace
    {
        // Cells of dimension top-1 around a cell of dimension top-2, in the
        // cyclic order that makes the dual face's boundary chain.
        [[nodiscard]] Result<std::vector<CellId>> Ring(const Complex& complex, CellId cell)
        {
            const IncidenceGraph& graph = complex.Graph();
            std::vector<CellId> ring;

            if (complex.Kind() == ComplexKind::Surface)
            {
                // Edge leaving the vertex in each face of the radial fan.
                for (CellId f : Orbits::RadialFan(graph, cell))
                    ring.push_back(graph.Boundary(f)[*Orbits::FindStepFrom(graph, f, cell)].Cell);
            }
            else
            {
                auto faces = Orbits::EdgeRing(complex, cell);
                if (!faces) return std::unexpected(std::move(faces.error()));
                ring = faces->Cells();
            }

            if (ring.size() != graph.Coboundary(cell).size())
            {
                return Fail(Core::ErrorCode::DegenerateTopology, "cell has no single cyclic neighbourhood", {cell});
            }
            return ring;
        }

        // Top cell a dual step over q* ends at, for the sign it is traversed with.
        [[nodiscard]] CellId DualStepEnd(const IncidenceGraph& graph, CellId q, Orientation sign)
        {
            for (const Incidence& c : graph.Coboundary(q))
                if (c.Sign == sign) return c.Cell;
            return {};
        }

        [[nodiscard]] bool Bounds(const IncidenceGraph& graph, CellId top, CellId q)
        {
            return graph.FindIncidence(top, q).has_value();
        }
    }

    Result<DualResult> Dual(const Complex& complex)
    {
        const IncidenceGraph& graph = complex.Graph();
        const Dimension top = TopDimension(complex.Kind());
        const Dimension ridge = *Below(top);
        const Dimension peak = *Below(ridge);

        auto reject = [](TopologyError error) {
            Core::Log::Error("Dual: rejected, {}", Describe(error));
            return std::unexpected(std::move(error));
        };

        for (CellId q : complex.AllCells(ridge))
        {
            if (graph.Coboundary(q).size() != 2)
            {
                return reject(TopologyError{Core::ErrorCode::DegenerateTopology, Invariant::None, {q},
                                            std::format("{} bounds {} cells; the complex is not closed",
                                                        DimensionToString(ridge), graph.Coboundary(q).size())});
            }
        }

        // Dual cells in order of dual dimension: primal top cells first.
        ComplexDump dump;
        dump.Kind = complex.Kind();
        std::vector<CellId> primal;
        std::unordered_map<CellId, std::uint32_t> index;
        for (std::size_t d = 0; d <= Rank(top); ++d)
        {
            const auto primalDim = static_cast<Dimension>(Rank(top) - d);
            for (CellId id : complex.AllCells(primalDim))
            {
                index.emplace(id, static_cast<std::uint32_t>(dump.Cells.size()));
                dump.Cells.push_back(static_cast<Dimension>(d));
                primal.push_back(id);
            }
        }

        auto link = [&](CellId dualParent, CellId dualChild, Orientation sign) {
            dump.Incidences.push_back({index.at(dualParent), index.at(dualChild), sign});
        };

        // Dual edges: tail is the top cell using the ridge Negative.
        for (CellId q : complex.AllCells(ridge))
        {
            const auto cofaces = graph.Coboundary(q);
            const Incidence& first = cofaces[0].Sign == Orientation::Negative ? cofaces[0] : cofaces[1];
            const Incidence& second = cofaces[0].Sign == Orientation::Negative ? cofaces[1] : cofaces[0];
            link(q, first.Cell, first.Sign);
            link(q, second.Cell, second.Sign);
        }

        // Dual faces: the ring around each peak, turned so the signs chain.
        for (CellId p : complex.AllCells(peak))
        {
            auto ring = Ring(complex, p);
            if (!ring) return reject(std::move(ring.error()));

            std::vector<CellId>& order = *ring;
            if (order.size() > 2)
            {
                const CellId end = DualStepEnd(graph, order[0], *graph.FindIncidence(order[0], p));
                if (!Bounds(graph, end, order[1])) std::reverse(order.begin(), order.end());
            }
            for (CellId q : order) link(p, q, *graph.FindIncidence(q, p));
        }

        // Dual volumes: one per primal vertex, shells are unordered.
        if (top == Dimension::Volume)
        {
            for (CellId v : complex.AllCells(Dimension::Vertex))
                for (const Incidence& e : graph.Coboundary(v)) link(v, e.Cell, e.Sign);
        }

        auto loaded = Complex::FromCells(dump, complex.Options());
        if (!loaded) return std::unexpected(std::move(loaded.error()));

        DualResult result{std::move(loaded->Loaded), {}};
        result.PrimalToDual.reserve(primal.size());
        for (std::size_t i = 0; i < primal.size(); ++i) result.PrimalToDual.emplace(primal[i], loaded->CellIds[i]);

        Core::Log::Info("Dual: V={} E={} F={} C={}", result.Dual.Count(Dimension::Vertex),
                        result.Dual.Count(Dimension::Edge), result.Dual.Count(Dimension::Face),
                        result.Dual.Count(Dimension::Volume));
        return result;
    }
}
