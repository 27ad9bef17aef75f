module;

#include <cstdint>
#include <string_view>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // This module defines the standardized error handling pattern for the kernel:
    //
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - Topology edits whose preconditions may not hold
    //                          - Bulk loading and validation of external data
    //                          - Lookups of identifiers supplied by collaborators
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          not an error. Use when:
    //                          - Searching for an edge between two vertices
    //                          - Locating a cell inside a boundary cycle
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference".
    //                          NEVER return raw pointers for newly allocated resources!
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //                          If violated, indicates a bug, not a runtime error.
    // -------------------------------------------------------------------------

    // Generic error code for operations that can fail for multiple reasons
    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        OutOfRange = 303,

        // Topology errors (700-799)
        UnknownCell = 700,
        DanglingReference = 701,
        InvariantViolation = 702,
        TopologyError = 710,
        InvalidSplit = 711,
        NotAdjacent = 712,
        IncompatibleBoundary = 713,
        DegenerateTopology = 714,
        CellInUse = 715,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:              return "Success";
            case ErrorCode::InvalidArgument:      return "InvalidArgument";
            case ErrorCode::InvalidState:         return "InvalidState";
            case ErrorCode::OutOfRange:           return "OutOfRange";
            case ErrorCode::UnknownCell:          return "UnknownCell";
            case ErrorCode::DanglingReference:    return "DanglingReference";
            case ErrorCode::InvariantViolation:   return "InvariantViolation";
            case ErrorCode::TopologyError:        return "TopologyError";
            case ErrorCode::InvalidSplit:         return "InvalidSplit";
            case ErrorCode::NotAdjacent:          return "NotAdjacent";
            case ErrorCode::IncompatibleBoundary: return "IncompatibleBoundary";
            case ErrorCode::DegenerateTopology:   return "DegenerateTopology";
            case ErrorCode::CellInUse:            return "CellInUse";
            default:                              return "Unknown";
        }
    }

    // Value type of operations that only report success or failure
    struct Unit {};
    constexpr Unit unit{};
}
