module;

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

export module Topology:Algorithms;

import Core;
import :Cells;
import :Errors;
import :Complex;

export namespace Topology::Algorithms
{
    // Genus of a surface complex from the tracked data:
    //   g = (2 * components - boundaryLoops - chi) / 2
    // O(1). Volumetric complexes have no genus (InvalidState).
    [[nodiscard]] Result<std::int64_t> Genus(const Complex& complex);

    // =========================================================================
    // Refinement
    // =========================================================================
    //
    // Catmull-Clark connectivity without geometry: every edge gets a
    // midpoint, every k-gon gets a centre vertex and becomes k quads
    // (corner, midpoint, centre, midpoint). Built from SplitEdge and
    // SplitFace only, so each step is validated and chi never changes.
    //
    // One iteration takes (V, E, F) to (V + E + F, 2E + sum(k), sum(k)).
    // Surface complexes only.

    struct RefinementParams
    {
        std::size_t Iterations{1};
    };

    struct RefinementResult
    {
        std::size_t IterationsPerformed{0};

        std::size_t FinalVertexCount{0};
        std::size_t FinalEdgeCount{0};
        std::size_t FinalFaceCount{0};

        bool AllQuads{false};
    };

    // Refines in place. A failing step leaves the complex as refined up to
    // the last committed operator and returns that operator's error.
    [[nodiscard]] Result<RefinementResult> Refine(Complex& complex, const RefinementParams& params = {});

    // Triangulation of one k-gon around a new centre vertex: k spokes and k
    // triangles, chi unchanged. Corners are counted from the smallest vertex
    // id in boundary order; Spokes[i] runs from corner i to the centre and
    // Faces[i] is the triangle on boundary step i. Faces[0] keeps the id of
    // the original face. Triangles bounding volumes are added to every
    // volume the face bounded.
    struct TriangulationResult
    {
        CellId Centre;
        std::vector<CellId> Spokes;
        std::vector<CellId> Faces;
    };

    [[nodiscard]] Result<TriangulationResult> TriangulateFace(Complex& complex, CellId face);

    // =========================================================================
    // Duality
    // =========================================================================
    //
    // Poincare dual of a closed complex of top dimension n: each k-cell maps
    // to an (n-k)-cell, [p : c] in the primal becomes [c* : p*] with the same
    // sign. Surfaces order dual faces by the vertex star, volumetric duals
    // order dual faces by the edge ring. The dual is loaded through the
    // validating bulk loader. Complexes with boundary are rejected
    // (DegenerateTopology).

    struct DualResult
    {
        Complex Dual;
        std::unordered_map<CellId, CellId> PrimalToDual;
    };

    [[nodiscard]] Result<DualResult> Dual(const Complex& complex);
}
