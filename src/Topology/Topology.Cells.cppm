module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

export module Topology:Cells;

import Core;

export namespace Topology
{
    struct CellTag
    {
    };

    // Opaque, ordered and hashable token naming one cell of one Complex.
    // Slots are recycled under a generation guard, so an id must never be used
    // as an array index by collaborators.
    using CellId = Core::StrongHandle<CellTag>;

    enum class Dimension : std::uint8_t
    {
        Vertex = 0,
        Edge = 1,
        Face = 2,
        Volume = 3
    };

    constexpr std::size_t kDimensionCount = 4;

    [[nodiscard]] constexpr std::size_t Rank(Dimension d) noexcept
    {
        return static_cast<std::size_t>(d);
    }

    [[nodiscard]] constexpr std::optional<Dimension> Below(Dimension d) noexcept
    {
        if (d == Dimension::Vertex) return std::nullopt;
        return static_cast<Dimension>(Rank(d) - 1);
    }

    [[nodiscard]] constexpr std::optional<Dimension> Above(Dimension d) noexcept
    {
        if (d == Dimension::Volume) return std::nullopt;
        return static_cast<Dimension>(Rank(d) + 1);
    }

    [[nodiscard]] constexpr std::string_view DimensionToString(Dimension d) noexcept
    {
        switch (d)
        {
            case Dimension::Vertex: return "Vertex";
            case Dimension::Edge:   return "Edge";
            case Dimension::Face:   return "Face";
            case Dimension::Volume: return "Volume";
            default:                return "Unknown";
        }
    }

    // Sign of an incidence [parent : child]. Both sides of a pair store the same
    // sign. An edge's boundary is (tail, Negative), (head, Positive); a face
    // traverses a Positive edge from tail to head.
    enum class Orientation : std::int8_t
    {
        Positive = 1,
        Negative = -1
    };

    [[nodiscard]] constexpr Orientation Flip(Orientation o) noexcept
    {
        return o == Orientation::Positive ? Orientation::Negative : Orientation::Positive;
    }

    [[nodiscard]] constexpr int Sign(Orientation o) noexcept
    {
        return static_cast<int>(o);
    }

    [[nodiscard]] constexpr Orientation FromSign(int sign) noexcept
    {
        return sign >= 0 ? Orientation::Positive : Orientation::Negative;
    }

    struct Incidence
    {
        CellId Cell{};
        Orientation Sign{Orientation::Positive};

        bool operator==(const Incidence&) const = default;
    };

    // Surface complexes obey the 2-manifold rules (at most two faces per edge,
    // one fan per vertex). Volumetric complexes add 3-cells; there the manifold
    // rule moves up one dimension (at most two volumes per face).
    enum class ComplexKind : std::uint8_t
    {
        Surface,
        Volumetric
    };

    [[nodiscard]] constexpr Dimension TopDimension(ComplexKind kind) noexcept
    {
        return kind == ComplexKind::Surface ? Dimension::Face : Dimension::Volume;
    }
}
