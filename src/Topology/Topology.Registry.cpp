module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <format>
#include <vector>

module Topology:Registry.Impl;

import Core;
import :Registry;

namespace Topology
{
    CellId CellRegistry::Create(Dimension dim)
    {
        std::uint32_t index;
        if (!m_FreeIndices.empty())
        {
            index = m_FreeIndices.front();
            m_FreeIndices.pop_front();
            m_Attributes.Reset(index);
        }
        else
        {
            index = static_cast<std::uint32_t>(m_Slots.size());
            m_Slots.emplace_back();
            m_Attributes.Resize(m_Slots.size());
        }

        Slot& slot = m_Slots[index];
        assert(!slot.Alive && slot.References == 0);
        slot.Alive = true;
        slot.Dim = dim;
        ++m_Counts[Rank(dim)];

        return {index, slot.Generation};
    }

    Status CellRegistry::Destroy(CellId id)
    {
        if (!Contains(id))
            return Fail(Core::ErrorCode::UnknownCell, "destroy of a cell that is not live", {id});

        Slot& slot = m_Slots[id.Index];
        if (slot.References != 0)
        {
            return Fail(Core::ErrorCode::DanglingReference,
                        std::format("{} incidence records still name the cell", slot.References), {id});
        }

        slot.Alive = false;
        ++slot.Generation;
        --m_Counts[Rank(slot.Dim)];
        if (m_Holding)
            m_HeldIndices.push_back(id.Index);
        else
            m_FreeIndices.push_back(id.Index);
        return Ok();
    }

    void CellRegistry::UndoCreate(CellId id)
    {
        assert(Contains(id));
        Slot& slot = m_Slots[id.Index];
        assert(slot.References == 0);
        slot.Alive = false;
        --m_Counts[Rank(slot.Dim)];

        // A slot that was never destroyed before came from the end of the array.
        if (slot.Generation == 1 && id.Index + 1 == m_Slots.size())
        {
            m_Slots.pop_back();
            m_Attributes.Resize(m_Slots.size());
        }
        else
        {
            m_FreeIndices.push_front(id.Index);
        }
    }

    void CellRegistry::UndoDestroy(CellId id)
    {
        assert(id.Index < m_Slots.size());
        assert(m_Holding && !m_HeldIndices.empty() && m_HeldIndices.back() == id.Index);
        m_HeldIndices.pop_back();

        Slot& slot = m_Slots[id.Index];
        assert(!slot.Alive && slot.Generation == id.Generation + 1);
        --slot.Generation;
        slot.Alive = true;
        ++m_Counts[Rank(slot.Dim)];
    }

    void CellRegistry::ReleaseHeldSlots()
    {
        m_FreeIndices.insert(m_FreeIndices.end(), m_HeldIndices.begin(), m_HeldIndices.end());
        m_HeldIndices.clear();
        m_Holding = false;
    }

    bool CellRegistry::Contains(CellId id) const noexcept
    {
        if (!id.IsValid() || id.Index >= m_Slots.size()) return false;
        const Slot& slot = m_Slots[id.Index];
        return slot.Alive && slot.Generation == id.Generation;
    }

    Result<Dimension> CellRegistry::Lookup(CellId id) const
    {
        if (!Contains(id))
        {
            if (!id.IsValid() || id.Index >= m_Slots.size())
                return Fail(Core::ErrorCode::UnknownCell, "cell was never allocated", {id});
            return Fail(Core::ErrorCode::UnknownCell, "cell has been destroyed", {id});
        }
        return m_Slots[id.Index].Dim;
    }

    Dimension CellRegistry::DimensionOf(CellId id) const noexcept
    {
        assert(Contains(id));
        return m_Slots[id.Index].Dim;
    }

    void CellRegistry::Retain(CellId id) noexcept
    {
        assert(Contains(id));
        ++m_Slots[id.Index].References;
    }

    void CellRegistry::Release(CellId id) noexcept
    {
        assert(Contains(id));
        assert(m_Slots[id.Index].References > 0);
        --m_Slots[id.Index].References;
    }

    std::uint32_t CellRegistry::ReferenceCount(CellId id) const noexcept
    {
        assert(Contains(id));
        return m_Slots[id.Index].References;
    }

    std::size_t CellRegistry::LiveCount() const noexcept
    {
        std::size_t total = 0;
        for (std::size_t c : m_Counts) total += c;
        return total;
    }

    CellId CellRegistry::IdAt(std::uint32_t index) const noexcept
    {
        if (index >= m_Slots.size() || !m_Slots[index].Alive) return {};
        return {index, m_Slots[index].Generation};
    }

    std::vector<CellId> CellRegistry::All(Dimension dim) const
    {
        std::vector<CellId> out;
        out.reserve(Count(dim));
        ForEach(dim, [&](CellId id) { out.push_back(id); });
        return out;
    }
}
