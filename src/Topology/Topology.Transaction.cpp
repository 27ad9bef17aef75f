module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <string_view>
#include <utility>

module Topology:Transaction.Impl;

import Core;
import :Transaction;
import :Validation;

namespace Topology::Euler
{
    Status Require(const IncidenceGraph& graph, CellId id, Dimension dim)
    {
        auto found = graph.Registry().Lookup(id);
        if (!found) return std::unexpected(std::move(found.error()));
        if (*found != dim)
        {
            return Fail(Core::ErrorCode::InvalidArgument,
                        std::format("expected a {}, got a {}", DimensionToString(dim), DimensionToString(*found)),
                        {id});
        }
        return Ok();
    }

    Status RequireKind(const Complex& complex, ComplexKind kind, std::string_view op)
    {
        if (complex.Kind() == kind) return Ok();
        return Fail(Core::ErrorCode::InvalidState,
                    std::format("{} needs a {} complex", op, kind == ComplexKind::Surface ? "surface" : "volumetric"));
    }

    Transaction::Transaction(Complex& complex, std::string_view name)
        : m_Complex(complex), m_Lock(complex.m_Mutex), m_Name(name)
    {
        m_Complex.m_Graph.Registry().HoldFreedSlots();
    }

    Transaction::~Transaction()
    {
        if (!m_Finished) Rollback();
    }

    CellId Transaction::AddCell(Dimension dim)
    {
        const CellId id = m_Complex.m_Graph.AddCell(dim);
        if (dim == Dimension::Vertex) m_Complex.m_Components.Forget(id);
        m_Journal.push_back(Entry{Op::Add, id, {}, Orientation::Positive, {}});
        m_Touched.push_back(id);
        return id;
    }

    Status Transaction::RemoveCell(CellId id)
    {
        if (auto removed = m_Complex.m_Graph.RemoveCell(id); !removed)
            return std::unexpected(std::move(removed.error()));

        m_Journal.push_back(Entry{Op::Remove, id, {}, Orientation::Positive, {}});
        return Ok();
    }

    Status Transaction::Link(CellId parent, CellId child, Orientation sign, std::size_t boundaryPos)
    {
        auto linked = m_Complex.m_Graph.Link(parent, child, sign, boundaryPos);
        if (!linked) return std::unexpected(std::move(linked.error()));

        m_Journal.push_back(Entry{Op::Link, parent, child, sign, *linked});
        m_Touched.push_back(parent);
        m_Touched.push_back(child);

        const IncidenceGraph& graph = m_Complex.m_Graph;
        if (graph.DimensionOf(parent) == Dimension::Edge && graph.Boundary(parent).size() == 2)
        {
            const auto ends = graph.Boundary(parent);
            if (auto roots = m_Complex.m_Components.Connect(ends[0].Cell, ends[1].Cell, m_Labelled))
                m_Joins.push_back(*roots);
        }
        return Ok();
    }

    Result<UnlinkRecord> Transaction::Unlink(CellId parent, CellId child)
    {
        auto unlinked = m_Complex.m_Graph.Unlink(parent, child);
        if (!unlinked) return unlinked;

        m_Journal.push_back(Entry{Op::Unlink, parent, child, unlinked->Sign, unlinked->Position});
        m_Touched.push_back(parent);
        m_Touched.push_back(child);
        return unlinked;
    }

    bool Transaction::SameComponent(CellId a, CellId b)
    {
        return m_Complex.m_Components.SameComponent(a, b);
    }

    void Transaction::Expect(std::int64_t euler, std::int64_t components, std::int64_t boundaryLoops) noexcept
    {
        m_Delta.EulerCharacteristic += euler;
        m_Delta.Components += components;
        if (m_Complex.Kind() == ComplexKind::Surface) m_Delta.BoundaryLoops += boundaryLoops;
    }

    Status Transaction::Commit()
    {
        assert(!m_Finished);

        TrackedTopology& tracked = m_Complex.m_Tracked;
        tracked.EulerCharacteristic += m_Delta.EulerCharacteristic;
        tracked.Components += m_Delta.Components;
        tracked.BoundaryLoops += m_Delta.BoundaryLoops;
        m_DeltaApplied = true;

        const Validation::Report report = m_Complex.Options().Validation == ValidationLevel::Full
                                              ? Validation::Validate(m_Complex)
                                              : Validation::ValidateCells(m_Complex, m_Touched);
        if (!report.IsValid())
        {
            auto status = Validation::ToStatus(report, Core::ErrorCode::TopologyError);
            Core::Log::Warn("{}: rolled back, {}", m_Name, Describe(status.error()));
            Rollback();
            return status;
        }

        for (const auto& [a, b] : m_Joins) m_Complex.m_Components.Join(a, b);
        m_Complex.m_Graph.Registry().ReleaseHeldSlots();

        ++m_Complex.m_Epoch;
        m_Finished = true;
        m_Journal.clear();

        if (m_Complex.Options().LogOperators)
        {
            Core::Log::Debug("{}: committed, V={} E={} F={} C={} chi={}", m_Name,
                             m_Complex.Count(Dimension::Vertex), m_Complex.Count(Dimension::Edge),
                             m_Complex.Count(Dimension::Face), m_Complex.Count(Dimension::Volume),
                             tracked.EulerCharacteristic);
        }
        return Ok();
    }

    void Transaction::Rollback()
    {
        if (m_Finished) return;

        if (m_DeltaApplied)
        {
            TrackedTopology& tracked = m_Complex.m_Tracked;
            tracked.EulerCharacteristic -= m_Delta.EulerCharacteristic;
            tracked.Components -= m_Delta.Components;
            tracked.BoundaryLoops -= m_Delta.BoundaryLoops;
            m_DeltaApplied = false;
        }

        IncidenceGraph& graph = m_Complex.m_Graph;
        for (auto it = m_Journal.rbegin(); it != m_Journal.rend(); ++it)
        {
            switch (it->Kind)
            {
                case Op::Add:
                    graph.UndoAdd(it->Parent);
                    break;
                case Op::Remove:
                    graph.UndoRemove(it->Parent);
                    break;
                case Op::Link:
                {
                    auto undone = graph.Unlink(it->Parent, it->Child);
                    if (!undone)
                    {
                        Core::Log::Error("{}: rollback could not unlink {} from {}, {}", m_Name, it->Child,
                                         it->Parent, Describe(undone.error()));
                    }
                    else if (undone->Position.Boundary != it->Position.Boundary)
                    {
                        Core::Log::Error("{}: rollback unlinked {} from {} at position {}, journal says {}", m_Name,
                                         it->Child, it->Parent, undone->Position.Boundary, it->Position.Boundary);
                    }
                    break;
                }
                case Op::Unlink:
                {
                    auto redone = graph.Link(it->Parent, it->Child, it->Sign, it->Position.Boundary,
                                             it->Position.Coboundary);
                    if (!redone)
                    {
                        Core::Log::Error("{}: rollback could not relink {} to {}, {}", m_Name, it->Child,
                                         it->Parent, Describe(redone.error()));
                    }
                    break;
                }
            }
        }
        graph.Registry().ReleaseHeldSlots();
        for (CellId v : m_Labelled) m_Complex.m_Components.Forget(v);
        m_Labelled.clear();
        m_Joins.clear();
        m_Journal.clear();
        m_Finished = true;
    }
}
