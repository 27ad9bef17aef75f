#include <gtest/gtest.h>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

import Core;
import Topology;

#include "TestComplexBuilders.h"

using namespace Topology;

namespace
{
    // Walks every face under the read lock and checks that its boundary
    // chains. Returns false on the first torn face.
    bool ReadAllFaces(const Complex& complex)
    {
        auto lock = complex.ReadLock();
        const IncidenceGraph& graph = complex.Graph();
        for (CellId f : complex.AllCells(Dimension::Face))
        {
            const auto boundary = graph.Boundary(f);
            for (std::size_t i = 0; i < boundary.size(); ++i)
            {
                const Incidence& next = boundary[(i + 1) % boundary.size()];
                if (Orbits::StepEnd(graph, boundary[i]) != Orbits::StepStart(graph, next)) return false;
            }
        }
        return complex.CountedEulerCharacteristic() == complex.EulerCharacteristic();
    }
}

TEST(Concurrency, ReadersNeverSeeHalfAppliedOperators)
{
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;
    complex.SetValidation(ValidationLevel::Local);

    std::atomic<bool> done{false};
    std::atomic<std::size_t> reads{0};
    std::atomic<std::size_t> torn{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r)
    {
        readers.emplace_back([&] {
            while (!done.load(std::memory_order_acquire))
            {
                if (!ReadAllFaces(complex)) torn.fetch_add(1, std::memory_order_relaxed);
                reads.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    const auto epoch = complex.Epoch();
    const CellId edge = complex.Graph().Boundary(cube.Faces[2])[0].Cell;
    std::size_t failures = 0;
    std::thread writer([&] {
        for (int i = 0; i < 200; ++i)
        {
            auto split = Euler::SplitEdge(complex, edge);
            if (!split)
            {
                ++failures;
                continue;
            }
            if (!Euler::DeleteVertex(complex, split->Vertex)) ++failures;
        }
        done.store(true, std::memory_order_release);
    });

    writer.join();
    for (auto& t : readers) t.join();

    EXPECT_EQ(failures, 0u);
    EXPECT_EQ(torn.load(), 0u);
    EXPECT_GT(reads.load(), 0u);
    ExpectCounts(complex, 8, 12, 6);
    EXPECT_EQ(complex.Epoch(), epoch + 400);
    EXPECT_TRUE(complex.Contains(edge));
    ExpectValid(complex);
}

TEST(Concurrency, CopyUnderConcurrentEdits)
{
    auto cube = MakeCube();
    Complex& complex = cube.Loaded;
    complex.SetValidation(ValidationLevel::Local);

    std::atomic<bool> done{false};
    std::thread writer([&] {
        auto refined = Algorithms::Refine(complex);
        EXPECT_TRUE(refined.has_value());
        done.store(true, std::memory_order_release);
    });

    // Each copy is taken under the source's read lock, so it is a complex
    // between two committed operators.
    std::size_t copies = 0;
    while (!done.load(std::memory_order_acquire) || copies == 0)
    {
        Complex snapshot = complex;
        EXPECT_EQ(snapshot.CountedEulerCharacteristic(), snapshot.EulerCharacteristic());
        ++copies;
    }
    writer.join();

    ExpectCounts(complex, 26, 48, 24);
    ExpectValid(complex);
}
