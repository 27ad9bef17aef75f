module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <utility>
#include <vector>

export module Topology:Orbits;

import Core;
import :Cells;
import :Errors;
import :Incidence;
import :Complex;

export namespace Topology::Orbits
{
    // =========================================================================
    // Graph-level helpers (unchecked: ids must be live and of the right kind)
    // =========================================================================

    [[nodiscard]] CellId Tail(const IncidenceGraph& graph, CellId edge) noexcept;
    [[nodiscard]] CellId Head(const IncidenceGraph& graph, CellId edge) noexcept;
    [[nodiscard]] CellId Opposite(const IncidenceGraph& graph, CellId edge, CellId vertex) noexcept;

    // Vertex where a face (or hole) starts / ends traversing the oriented edge.
    [[nodiscard]] CellId StepStart(const IncidenceGraph& graph, Incidence step) noexcept;
    [[nodiscard]] CellId StepEnd(const IncidenceGraph& graph, Incidence step) noexcept;

    [[nodiscard]] std::optional<CellId> FindEdge(const IncidenceGraph& graph, CellId a, CellId b) noexcept;
    [[nodiscard]] std::optional<std::size_t> FindStepFrom(const IncidenceGraph& graph, CellId face,
                                                          CellId vertex) noexcept;
    [[nodiscard]] std::optional<std::size_t> FindStep(const IncidenceGraph& graph, CellId face, CellId edge) noexcept;

    // Index of the step starting at the smallest vertex id.
    [[nodiscard]] std::size_t CanonicalStart(const IncidenceGraph& graph, CellId face) noexcept;

    // Face corners in traversal order, starting at the smallest vertex id.
    [[nodiscard]] std::vector<CellId> FaceVertices(const IncidenceGraph& graph, CellId face);
    [[nodiscard]] std::vector<CellId> VertexEdges(const IncidenceGraph& graph, CellId vertex);

    // Surface faces around a vertex in radial order, starting at a boundary
    // edge when the vertex has one. A pinched vertex yields only one fan.
    [[nodiscard]] std::vector<CellId> RadialFan(const IncidenceGraph& graph, CellId vertex);

    // Each loop lists its edges with the sign a face filling the hole would
    // use, i.e. opposite to the sign of the single face on the edge.
    [[nodiscard]] std::vector<std::vector<Incidence>> BoundaryLoops(const IncidenceGraph& graph);
    [[nodiscard]] std::size_t CountBoundaryLoops(const IncidenceGraph& graph);

    [[nodiscard]] std::size_t CountComponents(const IncidenceGraph& graph);

    // =========================================================================
    // Lazy traversal ranges
    // =========================================================================

    struct BoundaryStep
    {
        CellId Vertex{}; // where the step starts
        CellId Edge{};
        Orientation Sign{Orientation::Positive};

        bool operator==(const BoundaryStep&) const = default;
    };

    class FaceBoundaryRange
    {
    public:
        class Iterator
        {
        public:
            using value_type = BoundaryStep;
            using difference_type = std::ptrdiff_t;

            Iterator() = default;

            [[nodiscard]] BoundaryStep operator*() const;
            Iterator& operator++();
            Iterator operator++(int)
            {
                Iterator tmp = *this;
                ++*this;
                return tmp;
            }

            [[nodiscard]] bool operator==(std::default_sentinel_t) const noexcept
            {
                return m_Range == nullptr || m_Visited >= m_Range->m_Size;
            }

        private:
            friend class FaceBoundaryRange;
            explicit Iterator(const FaceBoundaryRange* range) : m_Range(range) {}

            const FaceBoundaryRange* m_Range = nullptr;
            std::size_t m_Visited = 0;
        };

        FaceBoundaryRange(const Complex& complex, CellId face);

        [[nodiscard]] Iterator begin() const { return Iterator(this); }
        [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }
        [[nodiscard]] std::size_t size() const noexcept { return m_Size; }

    private:
        const Complex* m_Complex;
        CellId m_Face;
        std::uint64_t m_Epoch;
        std::size_t m_Start;
        std::size_t m_Size;
    };

    // Faces around a vertex. On surfaces the order is radial (the next face
    // shares the current face's outgoing edge at the vertex); a boundary
    // vertex yields its fan from one boundary edge to the other. Volumetric
    // complexes have no radial order and yield ascending ids.
    class VertexStarRange
    {
    public:
        class Iterator
        {
        public:
            using value_type = CellId;
            using difference_type = std::ptrdiff_t;

            Iterator() = default;

            [[nodiscard]] CellId operator*() const;
            Iterator& operator++();
            Iterator operator++(int)
            {
                Iterator tmp = *this;
                ++*this;
                return tmp;
            }

            [[nodiscard]] bool operator==(std::default_sentinel_t) const noexcept { return !m_Face.IsValid(); }

        private:
            friend class VertexStarRange;

            const VertexStarRange* m_Range = nullptr;
            CellId m_First{};
            CellId m_Face{};
            std::size_t m_Step = 0; // step of m_Face leaving the vertex, or index into m_Sorted
            std::size_t m_Visited = 0;
        };

        VertexStarRange(const Complex& complex, CellId vertex);

        [[nodiscard]] Iterator begin() const;
        [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    private:
        void CheckEpoch() const noexcept
        {
            assert(m_Complex->Epoch() == m_Epoch && "complex edited during traversal");
        }

        const Complex* m_Complex;
        CellId m_Vertex;
        std::uint64_t m_Epoch;
        std::size_t m_Limit;
        std::vector<CellId> m_Sorted; // volumetric complexes only
    };

    // Snapshot of a bounded set of cells (EdgeRing, Star, Link).
    class CellRange
    {
    public:
        CellRange() = default;
        explicit CellRange(std::vector<CellId> cells) : m_Cells(std::move(cells)) {}

        [[nodiscard]] auto begin() const noexcept { return m_Cells.begin(); }
        [[nodiscard]] auto end() const noexcept { return m_Cells.end(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_Cells.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Cells.empty(); }
        [[nodiscard]] CellId operator[](std::size_t i) const noexcept { return m_Cells[i]; }
        [[nodiscard]] const std::vector<CellId>& Cells() const noexcept { return m_Cells; }

    private:
        std::vector<CellId> m_Cells;
    };

    // =========================================================================
    // Checked entry points
    // =========================================================================

    [[nodiscard]] Result<FaceBoundaryRange> FaceBoundary(const Complex& complex, CellId face);
    [[nodiscard]] Result<VertexStarRange> VertexStar(const Complex& complex, CellId vertex);

    // Faces on an edge. Surfaces: the face using the edge Positive first.
    // Volumetric: radial order through the volumes around the edge, then any
    // faces not reached that way in ascending id order.
    [[nodiscard]] Result<CellRange> EdgeRing(const Complex& complex, CellId edge);

    // The cell and every cell having it as a face, by dimension then id.
    [[nodiscard]] Result<CellRange> Star(const Complex& complex, CellId cell);

    // The cell and all of its faces, by dimension then id.
    [[nodiscard]] Result<CellRange> Closure(const Complex& complex, CellId cell);

    // Closure of the star minus the star of the closure: for a surface vertex
    // the ring of opposite vertices and edges.
    [[nodiscard]] Result<CellRange> Link(const Complex& complex, CellId cell);
}
