module;

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <vector>

export module Topology:Incidence;

import Core;
import :Cells;
import :Errors;
import :Registry;

export namespace Topology
{
    // Read-only snapshot of one cell. The spans point into the graph and are
    // invalidated by the next edit of the owning complex.
    struct CellView
    {
        CellId Id{};
        Dimension Dim{Dimension::Vertex};
        std::span<const Incidence> Boundary;
        std::span<const Incidence> Coboundary;
    };

    struct LinkPosition
    {
        std::size_t Boundary = 0;   // index in the parent's boundary list
        std::size_t Coboundary = 0; // index in the child's co-boundary list
    };

    struct UnlinkRecord
    {
        Orientation Sign{Orientation::Positive};
        LinkPosition Position;
    };

    // -------------------------------------------------------------------------
    // IncidenceGraph - oriented boundary / co-boundary records per cell
    // -------------------------------------------------------------------------
    // Owns the CellRegistry whose ids it links. Boundary lists are ordered:
    // an edge stores (tail, Negative), (head, Positive); a face stores its
    // cyclic edge sequence; a volume stores its shell faces. Co-boundary lists
    // carry no order of their own.
    //
    // Link and Unlink keep both sides of a pair in step and never repair a
    // broken graph: duplicates, dimension mismatches and missing pairs are
    // reported as InvariantViolation and leave the graph untouched.
    // -------------------------------------------------------------------------
    class IncidenceGraph
    {
    public:
        static constexpr std::size_t kAppend = std::numeric_limits<std::size_t>::max();

        IncidenceGraph() = default;

        [[nodiscard]] CellId AddCell(Dimension dim);
        [[nodiscard]] Status RemoveCell(CellId id);
        void UndoAdd(CellId id);
        void UndoRemove(CellId id);

        [[nodiscard]] Result<LinkPosition> Link(CellId parent, CellId child, Orientation sign,
                                                std::size_t boundaryPos = kAppend,
                                                std::size_t coboundaryPos = kAppend);
        [[nodiscard]] Result<UnlinkRecord> Unlink(CellId parent, CellId child);

        [[nodiscard]] Result<CellView> Get(CellId id) const;

        // Unchecked accessors for kernel code that already holds a live id.
        [[nodiscard]] std::span<const Incidence> Boundary(CellId id) const noexcept;
        [[nodiscard]] std::span<const Incidence> Coboundary(CellId id) const noexcept;
        [[nodiscard]] Dimension DimensionOf(CellId id) const noexcept { return m_Registry.DimensionOf(id); }
        [[nodiscard]] bool Contains(CellId id) const noexcept { return m_Registry.Contains(id); }

        [[nodiscard]] std::optional<Orientation> FindIncidence(CellId parent, CellId child) const noexcept;

        [[nodiscard]] CellRegistry& Registry() noexcept { return m_Registry; }
        [[nodiscard]] const CellRegistry& Registry() const noexcept { return m_Registry; }

    private:
        struct Record
        {
            std::vector<Incidence> Boundary;
            std::vector<Incidence> Coboundary;
        };

        void SyncRecords();

        CellRegistry m_Registry;
        std::vector<Record> m_Records;
    };
}
