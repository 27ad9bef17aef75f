module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

export module Topology:Euler;

import Core;
import :Cells;
import :Errors;
import :Complex;

export namespace Topology::Euler
{
    // =========================================================================
    // Euler operators
    // =========================================================================
    // Every operator is atomic: it either commits a complex that satisfies
    // all structural invariants or leaves the complex exactly as it was and
    // returns the reason. Ids of surviving cells are kept; ids of removed
    // cells become stale.
    //
    // Precondition failures use the TopologyError family of codes; a change
    // that passes the preconditions but breaks an invariant in the local
    // check is rolled back with Code = TopologyError and the invariant named.
    // =========================================================================

    struct SplitEdgeResult
    {
        CellId Vertex; // inserted vertex
        CellId Edge;   // new edge from the inserted vertex to the old head
    };

    // e = (a -> b) becomes (a -> m) and (m -> b). Each face on e gains the new
    // edge next to e; chi is unchanged.
    //
    //      a ---------- b        a ---- m ---- b
    //            e          =>      e     new
    [[nodiscard]] Result<SplitEdgeResult> SplitEdge(Complex& complex, CellId edge);

    struct SplitFaceResult
    {
        CellId Edge; // new edge v1 -> v2
        CellId Face; // new face
    };

    // Inserts the edge v1 -> v2 across f. f keeps the part of its boundary
    // from v1 forward to v2; the new face takes the rest. Both vertices must
    // be corners of f and must not already share an edge.
    [[nodiscard]] Result<SplitFaceResult> SplitFace(Complex& complex, CellId face, CellId v1, CellId v2);

    // Inverse of SplitFace: removes the single edge shared by f1 and f2. f1
    // survives and takes f2's boundary.
    [[nodiscard]] Result<CellId> MergeFaces(Complex& complex, CellId f1, CellId f2);

    struct HandleResult
    {
        std::vector<CellId> Edges; // Edges[i] joins the i-th aligned vertex pair
        std::vector<CellId> Faces; // quads of the tube, Faces[i] between Edges[i] and Edges[i+1]
        bool JoinedComponents = false;
    };

    // Removes f1 and f2 and connects their boundaries with a tube of quads.
    // Vertex a_i of f1 (counted forward from v1) is paired with vertex b_i of
    // f2 counted backward from v2, so the tube is orientable. A missing
    // alignment vertex means the smallest vertex id, and the face without
    // one is turned to the first pairing that reuses no existing edge
    // (DegenerateTopology if none does). Same component: genus + 1.
    // Different components: they are joined.
    [[nodiscard]] Result<HandleResult> CreateHandle(Complex& complex, CellId f1, CellId f2,
                                                    std::optional<CellId> v1 = std::nullopt,
                                                    std::optional<CellId> v2 = std::nullopt);

    // Removes f and leaves its edges as a new boundary loop, returned in
    // traversal order. Holes may not touch an existing boundary.
    [[nodiscard]] Result<std::vector<CellId>> CreateHole(Complex& complex, CellId face);

    // Fills one whole boundary loop with a new face. The edges may be given
    // in any order.
    [[nodiscard]] Result<CellId> CloseHole(Complex& complex, std::span<const CellId> edges);

    // Inverse of SplitEdge on a vertex with exactly two edges.
    [[nodiscard]] Status DeleteVertex(Complex& complex, CellId vertex);

    // Removes an interior edge by merging its two faces; returns the
    // surviving face.
    [[nodiscard]] Result<CellId> DeleteEdge(Complex& complex, CellId edge);

    // Removes a face that bounds no volume. On a surface this opens a hole.
    [[nodiscard]] Status DeleteFace(Complex& complex, CellId face);

    // =========================================================================
    // Seed primitives
    // =========================================================================

    enum class PolygonShell : std::uint8_t
    {
        Disk,  // one face, one boundary loop, chi = 1
        Sphere // two faces sharing every edge, chi = 2
    };

    struct PolygonResult
    {
        std::vector<CellId> Vertices;
        std::vector<CellId> Edges; // Edges[i] runs Vertices[i] -> Vertices[i+1]
        std::vector<CellId> Faces; // front face first
    };

    // New component made of an n-gon. Surface complexes only.
    [[nodiscard]] Result<PolygonResult> MakePolygon(Complex& complex, std::size_t corners,
                                                    PolygonShell shell = PolygonShell::Sphere);

    // =========================================================================
    // Volumetric complexes
    // =========================================================================

    // Adds a 3-cell bounded by the faces, which must form one closed
    // orientable shell. Orientation is chosen to agree with the volumes
    // already on those faces.
    [[nodiscard]] Result<CellId> AttachVolume(Complex& complex, std::span<const CellId> faces);

    [[nodiscard]] Status DeleteVolume(Complex& complex, CellId volume);
}
