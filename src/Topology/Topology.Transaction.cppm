module;

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>

export module Topology:Transaction;

import Core;
import :Cells;
import :Errors;
import :Incidence;
import :Complex;

namespace Topology::Euler
{
    // Precondition helpers shared by the operators.
    [[nodiscard]] Status Require(const IncidenceGraph& graph, CellId id, Dimension dim);
    [[nodiscard]] Status RequireKind(const Complex& complex, ComplexKind kind, std::string_view op);
}

export namespace Topology::Euler
{
    // -------------------------------------------------------------------------
    // Transaction - the only write path into a Complex
    // -------------------------------------------------------------------------
    // Holds the complex's exclusive lock for its lifetime and journals every
    // primitive edit. Commit() applies the declared change of the tracked
    // topology, validates the touched cells (or the whole complex under
    // ValidationLevel::Full) and bumps the edit epoch. Anything else, an
    // explicit Rollback(), a failed Commit() or leaving scope uncommitted,
    // replays the journal backwards and restores the complex exactly.
    //
    // The Euler operators are built on it; callers may compose their own
    // edits the same way. Local validation trusts the declared component and
    // boundary-loop deltas, Full validation recounts them.
    // -------------------------------------------------------------------------
    class Transaction
    {
    public:
        Transaction(Complex& complex, std::string_view name);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        [[nodiscard]] const IncidenceGraph& Graph() const noexcept { return m_Complex.m_Graph; }
        [[nodiscard]] const Complex& Target() const noexcept { return m_Complex; }

        [[nodiscard]] CellId AddCell(Dimension dim);
        [[nodiscard]] Status RemoveCell(CellId id);
        [[nodiscard]] Status Link(CellId parent, CellId child, Orientation sign,
                                  std::size_t boundaryPos = IncidenceGraph::kAppend);
        [[nodiscard]] Result<UnlinkRecord> Unlink(CellId parent, CellId child);

        // Change of the tracked quantities this edit is expected to cause.
        void Expect(std::int64_t euler, std::int64_t components = 0, std::int64_t boundaryLoops = 0) noexcept;

        // Marks a cell for the local check without editing it.
        void Touch(CellId id) { m_Touched.push_back(id); }

        // Whether two vertices lie in one component before this edit. O(alpha).
        [[nodiscard]] bool SameComponent(CellId a, CellId b);

        [[nodiscard]] Status Commit();
        void Rollback();

    private:
        enum class Op : std::uint8_t
        {
            Add,
            Remove,
            Link,
            Unlink
        };

        struct Entry
        {
            Op Kind;
            CellId Parent;
            CellId Child;
            Orientation Sign;
            LinkPosition Position;
        };

        Complex& m_Complex;
        std::unique_lock<std::shared_mutex> m_Lock;
        std::string_view m_Name;
        std::vector<Entry> m_Journal;
        std::vector<CellId> m_Touched;
        std::vector<std::pair<std::uint32_t, std::uint32_t>> m_Joins;
        std::vector<CellId> m_Labelled;
        TrackedTopology m_Delta;
        bool m_DeltaApplied = false;
        bool m_Finished = false;
    };
}
