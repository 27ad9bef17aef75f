module;

#include <cstddef>
#include <span>
#include <string>
#include <vector>

export module Topology:Validation;

import Core;
import :Cells;
import :Errors;
import :Complex;

export namespace Topology::Validation
{
    struct Finding
    {
        Invariant Kind{Invariant::None};
        std::vector<CellId> Cells;
        std::string Detail;
    };

    struct Report
    {
        std::vector<Finding> Findings;
        std::size_t CellsChecked = 0;

        [[nodiscard]] bool IsValid() const noexcept { return Findings.empty(); }
    };

    // Every live cell, then a recount of chi, components and boundary loops
    // against the tracked values. O(cells).
    [[nodiscard]] Report Validate(const Complex& complex);

    // Every live cell, no recount. Used by the bulk loaders before the
    // tracked values exist.
    [[nodiscard]] Report ValidateStructure(const Complex& complex);

    // The given cells plus the vertices and edges their records reach, then
    // the O(1) chi check from the registry counts. Dead ids are skipped.
    [[nodiscard]] Report ValidateCells(const Complex& complex, std::span<const CellId> cells);

    // First finding as an error with the given code.
    [[nodiscard]] Status ToStatus(const Report& report, Core::ErrorCode code = Core::ErrorCode::InvariantViolation);
}
