module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <unordered_set>
#include <utility>
#include <vector>

module Topology:Algorithms.Refinement.Impl;

import Core;
import :Algorithms;
import :Euler;
import :Orbits;
import :Transaction;

namespace Topology::Algorithms
{
    Result<std::int64_t> Genus(const Complex& complex)
    {
        if (complex.Kind() != ComplexKind::Surface)
            return Fail(Core::ErrorCode::InvalidState, "genus is defined for surface complexes only");

        const TrackedTopology& t = complex.Tracked();
        return (2 * t.Components - t.BoundaryLoops - t.EulerCharacteristic) / 2;
    }

    namespace
    {
        // Splits an original face whose edges already carry midpoints into
        // quads around a new centre vertex.
        [[nodiscard]] Status QuadrangulateFace(Complex& complex, CellId face,
                                               const std::unordered_set<CellId>& midpoints)
        {
            std::vector<CellId> mids;
            for (CellId v : Orbits::FaceVertices(complex.Graph(), face))
                if (midpoints.contains(v)) mids.push_back(v);

            // Corner triangle m0 - corner - m1, the rest goes to a new face.
            auto cut = Euler::SplitFace(complex, face, mids[0], mids[1]);
            if (!cut) return std::unexpected(std::move(cut.error()));

            auto centre = Euler::SplitEdge(complex, cut->Edge);
            if (!centre) return std::unexpected(std::move(centre.error()));

            CellId rest = cut->Face;
            for (std::size_t i = 2; i < mids.size(); ++i)
            {
                auto next = Euler::SplitFace(complex, rest, centre->Vertex, mids[i]);
                if (!next) return std::unexpected(std::move(next.error()));
                rest = next->Face;
            }
            return Ok();
        }

        [[nodiscard]] Status RefineOnce(Complex& complex)
        {
            const std::vector<CellId> edges = complex.AllCells(Dimension::Edge);
            const std::vector<CellId> faces = complex.AllCells(Dimension::Face);

            std::unordered_set<CellId> midpoints;
            midpoints.reserve(edges.size());
            for (CellId e : edges)
            {
                auto split = Euler::SplitEdge(complex, e);
                if (!split) return std::unexpected(std::move(split.error()));
                midpoints.insert(split->Vertex);
            }

            for (CellId f : faces)
                if (auto s = QuadrangulateFace(complex, f, midpoints); !s) return s;
            return Ok();
        }
    }

    Result<RefinementResult> Refine(Complex& complex, const RefinementParams& params)
    {
        if (complex.Kind() != ComplexKind::Surface)
            return Fail(Core::ErrorCode::InvalidState, "Refine needs a surface complex");

        RefinementResult result;
        for (std::size_t it = 0; it < params.Iterations; ++it)
        {
            if (auto s = RefineOnce(complex); !s)
            {
                Core::Log::Error("Refine: iteration {} failed, {}", it + 1, Describe(s.error()));
                return std::unexpected(std::move(s.error()));
            }
            ++result.IterationsPerformed;
        }

        result.FinalVertexCount = complex.Count(Dimension::Vertex);
        result.FinalEdgeCount = complex.Count(Dimension::Edge);
        result.FinalFaceCount = complex.Count(Dimension::Face);

        result.AllQuads = true;
        for (CellId f : complex.AllCells(Dimension::Face))
        {
            if (complex.Graph().Boundary(f).size() != 4)
            {
                result.AllQuads = false;
                break;
            }
        }

        Core::Log::Info("Refine: {} iteration(s), V={} E={} F={}", result.IterationsPerformed,
                        result.FinalVertexCount, result.FinalEdgeCount, result.FinalFaceCount);
        return result;
    }

    Result<TriangulationResult> TriangulateFace(Complex& complex, CellId face)
    {
        Euler::Transaction tx(complex, "TriangulateFace");
        const IncidenceGraph& graph = tx.Graph();
        if (auto s = Euler::Require(graph, face, Dimension::Face); !s) return std::unexpected(std::move(s.error()));

        const auto boundary = graph.Boundary(face);
        const std::size_t k = boundary.size();
        const std::size_t start = Orbits::CanonicalStart(graph, face);
        std::vector<Incidence> steps;
        std::vector<CellId> corners;
        steps.reserve(k);
        corners.reserve(k);
        for (std::size_t i = 0; i < k; ++i)
        {
            steps.push_back(boundary[(start + i) % k]);
            corners.push_back(Orbits::StepStart(graph, steps.back()));
        }
        const std::vector<Incidence> volumes(graph.Coboundary(face).begin(), graph.Coboundary(face).end());

        for (const Incidence& step : steps)
            if (auto s = tx.Unlink(face, step.Cell); !s) return std::unexpected(std::move(s.error()));

        TriangulationResult result;
        result.Centre = tx.AddCell(Dimension::Vertex);
        for (CellId corner : corners)
        {
            const CellId spoke = tx.AddCell(Dimension::Edge);
            if (auto s = tx.Link(spoke, corner, Orientation::Negative); !s)
                return std::unexpected(std::move(s.error()));
            if (auto s = tx.Link(spoke, result.Centre, Orientation::Positive); !s)
                return std::unexpected(std::move(s.error()));
            result.Spokes.push_back(spoke);
        }

        // Triangle i: corner i -> corner i+1 -> centre -> corner i.
        for (std::size_t i = 0; i < k; ++i)
        {
            const CellId triangle = i == 0 ? face : tx.AddCell(Dimension::Face);
            const Incidence sides[] = {
                steps[i],
                Incidence{result.Spokes[(i + 1) % k], Orientation::Positive},
                Incidence{result.Spokes[i], Orientation::Negative},
            };
            for (const Incidence& side : sides)
                if (auto s = tx.Link(triangle, side.Cell, side.Sign); !s) return std::unexpected(std::move(s.error()));
            if (i != 0)
            {
                for (const Incidence& c : volumes)
                    if (auto s = tx.Link(c.Cell, triangle, c.Sign); !s) return std::unexpected(std::move(s.error()));
            }
            result.Faces.push_back(triangle);
        }

        tx.Expect(0);
        if (auto s = tx.Commit(); !s) return std::unexpected(std::move(s.error()));

        Core::Log::Debug("TriangulateFace: {} triangles around {}", k, result.Centre);
        return result;
    }
}
