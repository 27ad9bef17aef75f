module;

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

module Topology:Validation.Impl;

import Core;
import :Validation;
import :Incidence;
import :Orbits;

namespace Topology::Validation
{
    namespace
    {
        class Checker
        {
        public:
            Checker(const Complex& complex, Report& report)
                : m_Complex(complex), m_Graph(complex.Graph()), m_Report(report)
            {
            }

            void Check(CellId id)
            {
                if (!m_Graph.Contains(id) || !m_Checked.insert(id).second) return;
                ++m_Report.CellsChecked;

                const std::size_t before = m_Report.Findings.size();
                CheckRecords(id);
                if (m_Report.Findings.size() != before) return;

                switch (m_Graph.DimensionOf(id))
                {
                    case Dimension::Vertex: CheckVertex(id); break;
                    case Dimension::Edge:   CheckEdge(id); break;
                    case Dimension::Face:   CheckFace(id); break;
                    case Dimension::Volume: CheckVolume(id); break;
                }
            }

        private:
            void Add(Invariant kind, std::vector<CellId> cells, std::string detail)
            {
                m_Report.Findings.push_back(Finding{kind, std::move(cells), std::move(detail)});
            }

            [[nodiscard]] bool WellFormedEdge(CellId edge) const
            {
                const auto b = m_Graph.Boundary(edge);
                return b.size() == 2 && b[0].Sign != b[1].Sign && b[0].Cell != b[1].Cell;
            }

            // Invariants 1 and 5: both sides of every pair, live targets,
            // adjacent dimensions, no duplicates.
            void CheckRecords(CellId id)
            {
                const Dimension dim = m_Graph.DimensionOf(id);

                auto checkSide = [&](std::span<const Incidence> list, bool boundary) {
                    std::unordered_set<CellId> seen;
                    for (const Incidence& inc : list)
                    {
                        if (!m_Graph.Contains(inc.Cell))
                        {
                            Add(Invariant::LiveReference, {id, inc.Cell}, "record names a destroyed cell");
                            continue;
                        }
                        if (!seen.insert(inc.Cell).second)
                        {
                            Add(Invariant::BidirectionalIncidence, {id, inc.Cell}, "incidence recorded twice");
                            continue;
                        }

                        const Dimension other = m_Graph.DimensionOf(inc.Cell);
                        const bool adjacent = boundary ? Rank(other) + 1 == Rank(dim) : Rank(other) == Rank(dim) + 1;
                        if (!adjacent)
                        {
                            Add(Invariant::BidirectionalIncidence, {id, inc.Cell},
                                std::format("{} linked to a {}", DimensionToString(dim), DimensionToString(other)));
                            continue;
                        }

                        const auto back = boundary ? m_Graph.Coboundary(inc.Cell) : m_Graph.Boundary(inc.Cell);
                        const bool found = std::any_of(back.begin(), back.end(), [&](const Incidence& b) {
                            return b.Cell == id && b.Sign == inc.Sign;
                        });
                        if (!found)
                        {
                            Add(Invariant::BidirectionalIncidence, {id, inc.Cell}, "incidence missing its mirror");
                        }
                    }
                };

                checkSide(m_Graph.Boundary(id), true);
                checkSide(m_Graph.Coboundary(id), false);
            }

            void CheckVertex(CellId v)
            {
                if (m_Graph.Coboundary(v).empty())
                {
                    Add(Invariant::ClosedBoundary, {v}, "isolated vertex");
                    return;
                }
                if (m_Complex.Kind() != ComplexKind::Surface) return;

                std::unordered_set<CellId> faces;
                std::size_t boundaryEdges = 0;
                for (const Incidence& e : m_Graph.Coboundary(v))
                {
                    if (!WellFormedEdge(e.Cell)) return;
                    const auto cofaces = m_Graph.Coboundary(e.Cell);
                    if (cofaces.size() == 1) ++boundaryEdges;
                    for (const Incidence& f : cofaces) faces.insert(f.Cell);
                }
                for (CellId f : faces)
                    for (const Incidence& step : m_Graph.Boundary(f))
                        if (!WellFormedEdge(step.Cell)) return;

                if (boundaryEdges != 0 && boundaryEdges != 2)
                {
                    Add(Invariant::RadialOrder, {v},
                        std::format("pinched vertex with {} boundary edges", boundaryEdges));
                    return;
                }

                const auto fan = Orbits::RadialFan(m_Graph, v);
                if (fan.size() != faces.size())
                {
                    Add(Invariant::RadialOrder, {v},
                        std::format("vertex star splits into several fans ({} of {} faces reachable)", fan.size(),
                                    faces.size()));
                }
            }

            void CheckEdge(CellId e)
            {
                if (!WellFormedEdge(e))
                {
                    Add(Invariant::ClosedBoundary, {e}, "edge needs one tail and one distinct head");
                    return;
                }

                const auto faces = m_Graph.Coboundary(e);
                if (faces.empty())
                {
                    Add(Invariant::ClosedBoundary, {e}, "edge bounds no face");
                    return;
                }

                if (m_Complex.Kind() == ComplexKind::Surface)
                {
                    if (faces.size() > 2)
                    {
                        Add(Invariant::RadialOrder, {e}, std::format("edge shared by {} faces", faces.size()));
                    }
                    else if (faces.size() == 2 && faces[0].Sign == faces[1].Sign)
                    {
                        Add(Invariant::RadialOrder, {e, faces[0].Cell, faces[1].Cell},
                            "adjacent faces traverse the edge in the same direction");
                    }
                }

                const CellId tail = Orbits::Tail(m_Graph, e);
                const CellId head = Orbits::Head(m_Graph, e);
                for (const Incidence& other : m_Graph.Coboundary(tail))
                {
                    if (other.Cell == e || !WellFormedEdge(other.Cell)) continue;
                    if (Orbits::Opposite(m_Graph, other.Cell, tail) == head)
                        Add(Invariant::RadialOrder, {e, other.Cell}, "parallel edges between the same vertices");
                }
            }

            void CheckFace(CellId f)
            {
                const auto boundary = m_Graph.Boundary(f);
                if (boundary.size() < 3)
                {
                    Add(Invariant::ClosedBoundary, {f}, std::format("face with {} edges", boundary.size()));
                    return;
                }
                for (const Incidence& step : boundary)
                    if (!WellFormedEdge(step.Cell)) return;

                std::unordered_set<CellId> corners;
                for (std::size_t i = 0; i < boundary.size(); ++i)
                {
                    const Incidence& step = boundary[i];
                    const Incidence& next = boundary[(i + 1) % boundary.size()];
                    if (Orbits::StepEnd(m_Graph, step) != Orbits::StepStart(m_Graph, next))
                    {
                        Add(Invariant::ClosedBoundary, {f, step.Cell, next.Cell}, "face boundary does not chain");
                        return;
                    }
                    if (!corners.insert(Orbits::StepStart(m_Graph, step)).second)
                    {
                        Add(Invariant::ClosedBoundary, {f, Orbits::StepStart(m_Graph, step)},
                            "face boundary visits a vertex twice");
                        return;
                    }
                }

                const auto volumes = m_Graph.Coboundary(f);
                if (m_Complex.Kind() == ComplexKind::Surface)
                {
                    if (!volumes.empty()) Add(Invariant::ClosedBoundary, {f}, "volume in a surface complex");
                    return;
                }
                if (volumes.size() > 2)
                {
                    Add(Invariant::RadialOrder, {f}, std::format("face shared by {} volumes", volumes.size()));
                }
                else if (volumes.size() == 2 && volumes[0].Sign == volumes[1].Sign)
                {
                    Add(Invariant::RadialOrder, {f, volumes[0].Cell, volumes[1].Cell},
                        "adjacent volumes induce the same orientation on the face");
                }
            }

            void CheckVolume(CellId c)
            {
                if (m_Complex.Kind() == ComplexKind::Surface)
                {
                    Add(Invariant::ClosedBoundary, {c}, "volume in a surface complex");
                    return;
                }

                const auto faces = m_Graph.Boundary(c);
                if (faces.empty())
                {
                    Add(Invariant::ClosedBoundary, {c}, "volume without faces");
                    return;
                }

                // Every edge of the shell is used twice with opposite induced sign.
                std::unordered_map<CellId, std::pair<int, int>> uses;
                for (const Incidence& face : faces)
                {
                    for (const Incidence& step : m_Graph.Boundary(face.Cell))
                    {
                        auto& [count, sum] = uses[step.Cell];
                        ++count;
                        sum += Sign(face.Sign) * Sign(step.Sign);
                    }
                }
                for (const auto& [edge, use] : uses)
                {
                    if (use.first != 2 || use.second != 0)
                    {
                        Add(Invariant::ClosedBoundary, {c, edge}, "volume shell is not closed and oriented");
                        return;
                    }
                }
            }

            const Complex& m_Complex;
            const IncidenceGraph& m_Graph;
            Report& m_Report;
            std::unordered_set<CellId> m_Checked;
        };

        void CheckAll(const Complex& complex, Report& report)
        {
            Checker checker(complex, report);
            for (std::size_t d = 0; d < kDimensionCount; ++d)
            {
                complex.Graph().Registry().ForEach(static_cast<Dimension>(d), [&](CellId id) { checker.Check(id); });
            }
        }

        void CheckEuler(const Complex& complex, Report& report)
        {
            const std::int64_t counted = complex.CountedEulerCharacteristic();
            if (counted != complex.Tracked().EulerCharacteristic)
            {
                report.Findings.push_back(Finding{
                    Invariant::EulerCharacteristic, {},
                    std::format("tracked chi {} but cells give {}", complex.Tracked().EulerCharacteristic, counted)});
            }
        }
    }

    Report Validate(const Complex& complex)
    {
        Report report;
        CheckAll(complex, report);
        if (!report.IsValid()) return report;

        CheckEuler(complex, report);

        const auto& graph = complex.Graph();
        const auto components = static_cast<std::int64_t>(Orbits::CountComponents(graph));
        if (components != complex.Tracked().Components)
        {
            report.Findings.push_back(Finding{
                Invariant::EulerCharacteristic, {},
                std::format("tracked {} components but found {}", complex.Tracked().Components, components)});
        }

        if (complex.Kind() == ComplexKind::Surface)
        {
            const auto loops = static_cast<std::int64_t>(Orbits::CountBoundaryLoops(graph));
            if (loops != complex.Tracked().BoundaryLoops)
            {
                report.Findings.push_back(Finding{
                    Invariant::EulerCharacteristic, {},
                    std::format("tracked {} boundary loops but found {}", complex.Tracked().BoundaryLoops, loops)});
            }
        }
        return report;
    }

    Report ValidateStructure(const Complex& complex)
    {
        Report report;
        CheckAll(complex, report);
        return report;
    }

    Report ValidateCells(const Complex& complex, std::span<const CellId> cells)
    {
        Report report;
        Checker checker(complex, report);
        const IncidenceGraph& graph = complex.Graph();

        for (CellId id : cells)
        {
            if (!graph.Contains(id)) continue;
            checker.Check(id);

            // Radial and manifold checks live on the lower cells.
            for (const Incidence& b : graph.Boundary(id))
            {
                if (!graph.Contains(b.Cell)) continue;
                checker.Check(b.Cell);
                for (const Incidence& bb : graph.Boundary(b.Cell))
                    checker.Check(bb.Cell);
            }
        }

        if (report.IsValid()) CheckEuler(complex, report);
        return report;
    }

    Status ToStatus(const Report& report, Core::ErrorCode code)
    {
        if (report.IsValid()) return Ok();
        const Finding& first = report.Findings.front();
        return std::unexpected(TopologyError{code, first.Kind, first.Cells, first.Detail});
    }
}
