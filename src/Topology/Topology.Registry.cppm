module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

export module Topology:Registry;

import Core;
import :Cells;
import :Errors;
import :Properties;

export namespace Topology
{
    // -------------------------------------------------------------------------
    // CellRegistry - generational slot allocator for cells of every dimension
    // -------------------------------------------------------------------------
    // A slot carries a generation and an alive flag. Freed indices are
    // recycled FIFO and a handle is only accepted while its generation
    // matches the slot. Destroy bumps the
    // generation, so ids held across a destroy fail with UnknownCell.
    //
    // The registry also counts incidence records naming each slot. Destroy is
    // refused while any record still references the cell.
    //
    // UndoCreate / UndoDestroy are the exact inverses used by the edit
    // journal and must be applied in reverse order. UndoDestroy is only
    // available between HoldFreedSlots() and ReleaseHeldSlots(): while held,
    // destroyed slots are parked instead of freed, so a Create in the same
    // edit never overwrites the dimension or payload row of a cell the
    // journal may still restore.
    // -------------------------------------------------------------------------
    class CellRegistry
    {
    public:
        CellRegistry() = default;

        [[nodiscard]] CellId Create(Dimension dim);
        [[nodiscard]] Status Destroy(CellId id);

        void UndoCreate(CellId id);
        void UndoDestroy(CellId id);

        void HoldFreedSlots() noexcept { m_Holding = true; }
        void ReleaseHeldSlots();
        [[nodiscard]] bool HoldsFreedSlots() const noexcept { return m_Holding; }

        [[nodiscard]] bool Contains(CellId id) const noexcept;
        [[nodiscard]] Result<Dimension> Lookup(CellId id) const;

        // Unchecked: id must be live.
        [[nodiscard]] Dimension DimensionOf(CellId id) const noexcept;

        void Retain(CellId id) noexcept;
        void Release(CellId id) noexcept;
        [[nodiscard]] std::uint32_t ReferenceCount(CellId id) const noexcept;

        [[nodiscard]] std::size_t Count(Dimension dim) const noexcept { return m_Counts[Rank(dim)]; }
        [[nodiscard]] std::size_t LiveCount() const noexcept;
        [[nodiscard]] std::size_t Capacity() const noexcept { return m_Slots.size(); }

        // Current id of a live slot, or an invalid id.
        [[nodiscard]] CellId IdAt(std::uint32_t index) const noexcept;

        // Live cells of one dimension in ascending slot order.
        [[nodiscard]] std::vector<CellId> All(Dimension dim) const;

        template <typename F>
        void ForEach(Dimension dim, F&& fn) const
        {
            for (std::uint32_t i = 0; i < m_Slots.size(); ++i)
            {
                const Slot& slot = m_Slots[i];
                if (slot.Alive && slot.Dim == dim) fn(CellId{i, slot.Generation});
            }
        }

        [[nodiscard]] PropertySet& Attributes() noexcept { return m_Attributes; }
        [[nodiscard]] const PropertySet& Attributes() const noexcept { return m_Attributes; }

    private:
        struct Slot
        {
            std::uint32_t Generation = 1;
            std::uint32_t References = 0;
            Dimension Dim = Dimension::Vertex;
            bool Alive = false;
        };

        std::vector<Slot> m_Slots;
        std::deque<std::uint32_t> m_FreeIndices;
        std::vector<std::uint32_t> m_HeldIndices;
        bool m_Holding = false;
        std::array<std::size_t, kDimensionCount> m_Counts{};
        PropertySet m_Attributes;
    };
}
