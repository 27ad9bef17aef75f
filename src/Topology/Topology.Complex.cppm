module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <utility>
#include <vector>

export module Topology:Complex;

import Core;
import :Cells;
import :Errors;
import :Properties;
import :Registry;
import :Incidence;

export namespace Topology::Euler
{
    class Transaction;
}

namespace Topology
{
    // Component label per vertex slot, merged through a union-find over the
    // labels. No operator disconnects a component, so labels are only ever
    // joined between loads; a bulk load relabels from scratch. Callers hold
    // the complex's exclusive lock, since Root() compresses paths.
    class ComponentLabels
    {
    public:
        static constexpr std::uint32_t kNone = std::numeric_limits<std::uint32_t>::max();

        void Rebuild(const IncidenceGraph& graph);

        // The slot was just given to a new vertex.
        void Forget(CellId vertex);

        // Called when an edge gains its second endpoint. An unlabelled
        // endpoint takes the other's label (or both get a fresh one) and is
        // appended to `labelled`; two different components are returned as
        // roots for a later Join.
        [[nodiscard]] std::optional<std::pair<std::uint32_t, std::uint32_t>> Connect(CellId tail, CellId head,
                                                                                     std::vector<CellId>& labelled);

        void Join(std::uint32_t a, std::uint32_t b);
        [[nodiscard]] bool SameComponent(CellId a, CellId b);

    private:
        [[nodiscard]] std::uint32_t LabelOf(CellId vertex) const noexcept;
        void Assign(CellId vertex, std::uint32_t label);
        [[nodiscard]] std::uint32_t Root(std::uint32_t label);
        [[nodiscard]] std::uint32_t Fresh();

        std::vector<std::uint32_t> m_VertexLabel; // by slot index
        std::vector<std::uint32_t> m_Parent;      // by label
        std::vector<std::uint32_t> m_Size;
    };
}

export namespace Topology
{
    enum class ValidationLevel : std::uint8_t
    {
        Local, // operators check the cells they touched plus the Euler count
        Full   // operators re-check the whole complex (tests, debugging)
    };

    struct ComplexOptions
    {
        ComplexKind Kind = ComplexKind::Surface;
        ValidationLevel Validation = ValidationLevel::Local;
        bool LogOperators = false; // Debug trace of every committed operator
    };

    // Quantities maintained incrementally by the operators and checked
    // against a recount by full validation.
    struct TrackedTopology
    {
        std::int64_t EulerCharacteristic = 0; // V - E + F - C
        std::int64_t Components = 0;
        std::int64_t BoundaryLoops = 0;       // surface complexes only

        bool operator==(const TrackedTopology&) const = default;
    };

    struct ComplexStats
    {
        std::array<std::size_t, kDimensionCount> Counts{};
        TrackedTopology Tracked;
        std::uint64_t Epoch = 0;
    };

    // Enumeration sufficient to rebuild a complex. Cells are numbered by their
    // position in Cells; the boundary order of a parent is the order of its
    // entries in Incidences.
    struct ComplexDump
    {
        struct Entry
        {
            std::uint32_t Parent = 0;
            std::uint32_t Child = 0;
            Orientation Sign = Orientation::Positive;
        };

        ComplexKind Kind = ComplexKind::Surface;
        std::vector<Dimension> Cells;
        std::vector<Entry> Incidences;
        std::vector<CellId> SourceIds; // ids in the dumped complex, empty for hand-built dumps
    };

    struct ComplexLoad;
    struct PolygonLoad;

    // -------------------------------------------------------------------------
    // Complex - owner of one cell complex
    // -------------------------------------------------------------------------
    // Holds the registry and incidence graph, the tracked Euler data and the
    // reader/writer lock. Structure is changed only through Euler::Transaction;
    // the public surface here is read-only apart from payload attributes.
    //
    // Queries do not lock. Readers that may race with a writer hold ReadLock()
    // for the duration of their traversal; every operator holds the exclusive
    // side for its whole edit.
    // -------------------------------------------------------------------------
    class Complex
    {
    public:
        Complex();
        explicit Complex(ComplexOptions options);
        ~Complex() = default;

        Complex(const Complex& other);
        Complex(Complex&& other) noexcept;
        Complex& operator=(const Complex& other);
        Complex& operator=(Complex&& other) noexcept;

        // ---------------------------------------------------------------------
        // Bulk loading
        // ---------------------------------------------------------------------

        // Faces are vertex index cycles; orientation follows the winding.
        [[nodiscard]] static Result<PolygonLoad> FromPolygons(std::size_t vertexCount,
                                                              std::span<const std::vector<std::uint32_t>> faces,
                                                              ComplexOptions options = {});

        // Volumes are lists of face indices; their orientation is derived.
        [[nodiscard]] static Result<PolygonLoad> FromPolyhedra(std::size_t vertexCount,
                                                               std::span<const std::vector<std::uint32_t>> faces,
                                                               std::span<const std::vector<std::uint32_t>> volumes,
                                                               ComplexOptions options = {ComplexKind::Volumetric});

        [[nodiscard]] static Result<ComplexLoad> FromCells(const ComplexDump& dump, ComplexOptions options = {});

        [[nodiscard]] ComplexDump Dump() const;

        // ---------------------------------------------------------------------
        // Queries
        // ---------------------------------------------------------------------
        [[nodiscard]] Result<CellView> Get(CellId id) const { return m_Graph.Get(id); }
        [[nodiscard]] bool Contains(CellId id) const noexcept { return m_Graph.Contains(id); }
        [[nodiscard]] Result<Dimension> DimensionOf(CellId id) const { return m_Graph.Registry().Lookup(id); }

        [[nodiscard]] Result<std::span<const Incidence>> BoundaryOf(CellId id) const;
        [[nodiscard]] Result<std::span<const Incidence>> CoboundaryOf(CellId id) const;

        [[nodiscard]] std::vector<CellId> AllCells(Dimension dim) const { return m_Graph.Registry().All(dim); }
        [[nodiscard]] std::size_t Count(Dimension dim) const noexcept { return m_Graph.Registry().Count(dim); }
        [[nodiscard]] std::size_t CellCount() const noexcept { return m_Graph.Registry().LiveCount(); }
        [[nodiscard]] bool Empty() const noexcept { return CellCount() == 0; }

        [[nodiscard]] std::int64_t EulerCharacteristic() const noexcept { return m_Tracked.EulerCharacteristic; }
        [[nodiscard]] std::int64_t CountedEulerCharacteristic() const noexcept;
        [[nodiscard]] const TrackedTopology& Tracked() const noexcept { return m_Tracked; }
        [[nodiscard]] ComplexStats Stats() const;

        [[nodiscard]] ComplexKind Kind() const noexcept { return m_Options.Kind; }
        [[nodiscard]] const ComplexOptions& Options() const noexcept { return m_Options; }
        void SetValidation(ValidationLevel level) noexcept { m_Options.Validation = level; }
        void SetLogOperators(bool enabled) noexcept { m_Options.LogOperators = enabled; }

        // Bumped by every committed edit; traversal ranges compare against it.
        [[nodiscard]] std::uint64_t Epoch() const noexcept { return m_Epoch; }

        [[nodiscard]] std::shared_lock<std::shared_mutex> ReadLock() const
        {
            return std::shared_lock<std::shared_mutex>(m_Mutex);
        }

        [[nodiscard]] const IncidenceGraph& Graph() const noexcept { return m_Graph; }

        // Payload columns, one row per cell slot. See CellProperty.
        [[nodiscard]] PropertySet& Attributes() noexcept { return m_Graph.Registry().Attributes(); }
        [[nodiscard]] const PropertySet& Attributes() const noexcept { return m_Graph.Registry().Attributes(); }

    private:
        friend class Euler::Transaction;

        [[nodiscard]] Status BuildPolygons(std::size_t vertexCount, std::span<const std::vector<std::uint32_t>> faces,
                                           std::vector<CellId>& vertices, std::vector<CellId>& created);
        [[nodiscard]] Status FinishLoad();
        void Retrack();

        ComplexOptions m_Options;
        IncidenceGraph m_Graph;
        TrackedTopology m_Tracked;
        ComponentLabels m_Components;
        std::uint64_t m_Epoch = 0;
        mutable std::shared_mutex m_Mutex;
    };

    struct ComplexLoad
    {
        Complex Loaded;
        std::vector<CellId> CellIds; // CellIds[i] is the id given to dump cell i
    };

    struct PolygonLoad
    {
        Complex Loaded;
        std::vector<CellId> Vertices;
        std::vector<CellId> Faces;
        std::vector<CellId> Volumes;
    };
}
