module;

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <utility>
#include <vector>

module Topology:Incidence.Impl;

import Core;
import :Incidence;

namespace Topology
{
    namespace
    {
        [[nodiscard]] std::optional<std::size_t> IndexOf(const std::vector<Incidence>& list, CellId cell) noexcept
        {
            for (std::size_t i = 0; i < list.size(); ++i)
                if (list[i].Cell == cell) return i;
            return std::nullopt;
        }
    }

    void IncidenceGraph::SyncRecords()
    {
        m_Records.resize(m_Registry.Capacity());
    }

    CellId IncidenceGraph::AddCell(Dimension dim)
    {
        const CellId id = m_Registry.Create(dim);
        SyncRecords();
        assert(m_Records[id.Index].Boundary.empty() && m_Records[id.Index].Coboundary.empty());
        return id;
    }

    Status IncidenceGraph::RemoveCell(CellId id)
    {
        return m_Registry.Destroy(id);
    }

    void IncidenceGraph::UndoAdd(CellId id)
    {
        m_Registry.UndoCreate(id);
        SyncRecords();
    }

    void IncidenceGraph::UndoRemove(CellId id)
    {
        m_Registry.UndoDestroy(id);
    }

    Result<LinkPosition> IncidenceGraph::Link(CellId parent, CellId child, Orientation sign,
                                              std::size_t boundaryPos, std::size_t coboundaryPos)
    {
        if (!m_Registry.Contains(parent) || !m_Registry.Contains(child))
        {
            return Fail(Core::ErrorCode::UnknownCell, "link between cells that are not live", {parent, child});
        }

        const Dimension pd = m_Registry.DimensionOf(parent);
        const Dimension cd = m_Registry.DimensionOf(child);
        if (Rank(pd) != Rank(cd) + 1)
        {
            return Violation(Invariant::BidirectionalIncidence,
                             std::format("cannot link a {} into the boundary of a {}", DimensionToString(cd),
                                         DimensionToString(pd)),
                             {parent, child});
        }

        auto& boundary = m_Records[parent.Index].Boundary;
        auto& coboundary = m_Records[child.Index].Coboundary;

        if (IndexOf(boundary, child) || IndexOf(coboundary, parent))
        {
            return Violation(Invariant::BidirectionalIncidence, "incidence pair is already recorded",
                             {parent, child});
        }

        if (boundaryPos == kAppend) boundaryPos = boundary.size();
        if (coboundaryPos == kAppend) coboundaryPos = coboundary.size();
        if (boundaryPos > boundary.size() || coboundaryPos > coboundary.size())
        {
            return Fail(Core::ErrorCode::OutOfRange, "link position past the end of the incidence list",
                        {parent, child});
        }

        boundary.insert(boundary.begin() + static_cast<std::ptrdiff_t>(boundaryPos), Incidence{child, sign});
        coboundary.insert(coboundary.begin() + static_cast<std::ptrdiff_t>(coboundaryPos), Incidence{parent, sign});
        m_Registry.Retain(parent);
        m_Registry.Retain(child);

        return LinkPosition{boundaryPos, coboundaryPos};
    }

    Result<UnlinkRecord> IncidenceGraph::Unlink(CellId parent, CellId child)
    {
        if (!m_Registry.Contains(parent) || !m_Registry.Contains(child))
        {
            return Fail(Core::ErrorCode::UnknownCell, "unlink between cells that are not live", {parent, child});
        }

        auto& boundary = m_Records[parent.Index].Boundary;
        auto& coboundary = m_Records[child.Index].Coboundary;

        const auto bi = IndexOf(boundary, child);
        const auto ci = IndexOf(coboundary, parent);
        if (!bi || !ci)
        {
            return Violation(Invariant::BidirectionalIncidence, "incidence pair is not recorded", {parent, child});
        }

        const Orientation sign = boundary[*bi].Sign;
        assert(coboundary[*ci].Sign == sign);

        boundary.erase(boundary.begin() + static_cast<std::ptrdiff_t>(*bi));
        coboundary.erase(coboundary.begin() + static_cast<std::ptrdiff_t>(*ci));
        m_Registry.Release(parent);
        m_Registry.Release(child);

        return UnlinkRecord{sign, LinkPosition{*bi, *ci}};
    }

    Result<CellView> IncidenceGraph::Get(CellId id) const
    {
        auto dim = m_Registry.Lookup(id);
        if (!dim) return std::unexpected(std::move(dim.error()));

        const Record& record = m_Records[id.Index];
        return CellView{id, *dim, record.Boundary, record.Coboundary};
    }

    std::span<const Incidence> IncidenceGraph::Boundary(CellId id) const noexcept
    {
        assert(m_Registry.Contains(id));
        return m_Records[id.Index].Boundary;
    }

    std::span<const Incidence> IncidenceGraph::Coboundary(CellId id) const noexcept
    {
        assert(m_Registry.Contains(id));
        return m_Records[id.Index].Coboundary;
    }

    std::optional<Orientation> IncidenceGraph::FindIncidence(CellId parent, CellId child) const noexcept
    {
        if (!m_Registry.Contains(parent) || !m_Registry.Contains(child)) return std::nullopt;
        const auto& boundary = m_Records[parent.Index].Boundary;
        if (auto i = IndexOf(boundary, child)) return boundary[*i].Sign;
        return std::nullopt;
    }
}
