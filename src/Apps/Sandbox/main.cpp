#include <array>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Topology;

using namespace Topology;

namespace
{
    // Unit cube, faces wound outward.
    const std::array<glm::vec3, 8> kCubeCorners = {
        glm::vec3{0, 0, 0}, glm::vec3{1, 0, 0}, glm::vec3{1, 1, 0}, glm::vec3{0, 1, 0},
        glm::vec3{0, 0, 1}, glm::vec3{1, 0, 1}, glm::vec3{1, 1, 1}, glm::vec3{0, 1, 1},
    };

    const std::vector<std::vector<std::uint32_t>> kCubeFaces = {
        {0, 3, 2, 1}, {4, 5, 6, 7}, {0, 1, 5, 4}, {1, 2, 6, 5}, {2, 3, 7, 6}, {3, 0, 4, 7},
    };

    void LogStats(const char* label, const Complex& complex)
    {
        const ComplexStats stats = complex.Stats();
        Core::Log::Info("{}: V={} E={} F={} chi={} components={} loops={}", label, stats.Counts[0], stats.Counts[1],
                        stats.Counts[2], stats.Tracked.EulerCharacteristic, stats.Tracked.Components,
                        stats.Tracked.BoundaryLoops);
    }
}

int main(int argc, char** argv)
{
    // --quiet keeps warnings and errors only, --trace logs every committed operator.
    ComplexOptions options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--quiet") Core::Log::SetMinimumLevel(Core::Log::Level::Warning);
        else if (arg == "--trace") options.LogOperators = true;
        else Core::Log::Warn("Sandbox: ignoring unknown argument '{}'", arg);
    }

    auto load = Complex::FromPolygons(kCubeCorners.size(), kCubeFaces, options);
    if (!load)
    {
        Core::Log::Error("Sandbox: cube rejected, {}", Describe(load.error()));
        return EXIT_FAILURE;
    }
    Complex& cube = load->Loaded;

    auto points = cube.Attributes().Add<glm::vec3>("v:point", glm::vec3(0.0f));
    for (std::size_t i = 0; i < load->Vertices.size(); ++i) points[load->Vertices[i]] = kCubeCorners[i];
    LogStats("Cube", cube);

    Complex refined = cube;
    auto refinement = Algorithms::Refine(refined);
    if (!refinement)
    {
        Core::Log::Error("Sandbox: refinement failed, {}", Describe(refinement.error()));
        return EXIT_FAILURE;
    }
    LogStats("Refined", refined);

    // Bottom and top paired with a quarter turn; the default pairing would
    // duplicate the vertical cube edges.
    auto handle = Euler::CreateHandle(cube, load->Faces[0], load->Faces[1], load->Vertices[0], load->Vertices[5]);
    if (!handle)
    {
        Core::Log::Error("Sandbox: handle failed, {}", Describe(handle.error()));
        return EXIT_FAILURE;
    }
    LogStats("Torus", cube);
    if (auto genus = Algorithms::Genus(cube)) Core::Log::Info("Torus genus: {}", *genus);

    // Corners keep their payload through the edit.
    const glm::vec3 p = points[load->Vertices[6]];
    Core::Log::Info("Vertex {} at ({}, {}, {})", load->Vertices[6], p.x, p.y, p.z);

    auto closed = Complex::FromPolygons(kCubeCorners.size(), kCubeFaces, options);
    if (!closed) return EXIT_FAILURE;
    auto dual = Algorithms::Dual(closed->Loaded);
    if (!dual)
    {
        Core::Log::Error("Sandbox: dual failed, {}", Describe(dual.error()));
        return EXIT_FAILURE;
    }
    LogStats("Octahedron", dual->Dual);

    if (auto report = Validation::Validate(cube); !report.IsValid())
    {
        Core::Log::Error("Sandbox: {} invariant findings", report.Findings.size());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
