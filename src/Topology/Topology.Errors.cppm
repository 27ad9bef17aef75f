module;

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

export module Topology:Errors;

import Core;
import :Cells;

export namespace Topology
{
    // Structural invariants of a valid complex. Rollback errors name the one
    // that the local check found broken.
    enum class Invariant : std::uint8_t
    {
        None = 0,
        BidirectionalIncidence, // every [p : c] is stored on both sides with one sign
        ClosedBoundary,         // face cycles close, volume shells close
        RadialOrder,            // manifold fans around vertices, <= 2 cofaces per ridge
        EulerCharacteristic,    // tracked chi / components / loops match a recount
        LiveReference           // no record names a destroyed cell
    };

    [[nodiscard]] constexpr std::string_view InvariantToString(Invariant inv) noexcept
    {
        switch (inv)
        {
            case Invariant::None:                   return "None";
            case Invariant::BidirectionalIncidence: return "BidirectionalIncidence";
            case Invariant::ClosedBoundary:         return "ClosedBoundary";
            case Invariant::RadialOrder:            return "RadialOrder";
            case Invariant::EulerCharacteristic:    return "EulerCharacteristic";
            case Invariant::LiveReference:          return "LiveReference";
            default:                                return "Unknown";
        }
    }

    struct TopologyError
    {
        Core::ErrorCode Code{Core::ErrorCode::TopologyError};
        Invariant Violated{Invariant::None};
        std::vector<CellId> Cells;
        std::string Detail;
    };

    template <typename T>
    using Result = std::expected<T, TopologyError>;

    using Status = Result<Core::Unit>;

    [[nodiscard]] inline Status Ok()
    {
        return Status(Core::unit);
    }

    [[nodiscard]] inline std::unexpected<TopologyError> Fail(Core::ErrorCode code,
                                                             std::string detail,
                                                             std::initializer_list<CellId> cells = {},
                                                             Invariant violated = Invariant::None)
    {
        return std::unexpected(TopologyError{code, violated, std::vector<CellId>(cells), std::move(detail)});
    }

    [[nodiscard]] inline std::unexpected<TopologyError> Violation(Invariant violated,
                                                                  std::string detail,
                                                                  std::vector<CellId> cells)
    {
        return std::unexpected(TopologyError{Core::ErrorCode::InvariantViolation, violated, std::move(cells),
                                             std::move(detail)});
    }

    // One-line rendering for log output: "CellInUse: vertex has 3 edges [#4.1]".
    [[nodiscard]] std::string Describe(const TopologyError& error);
}
